#include "pagezip/pipeline.hpp"
#include "pagezip/archiver.hpp"
#include "pagezip/persist.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace pagezip {

const char* to_string(PipelineState s) {
    switch (s) {
        case PipelineState::Idle:       return "idle";
        case PipelineState::Fetching:   return "fetching";
        case PipelineState::Collecting: return "collecting";
        case PipelineState::Archiving:  return "archiving";
        case PipelineState::Persisting: return "persisting";
        case PipelineState::Done:       return "done";
        case PipelineState::Failed:     return "failed";
    }
    return "unknown";
}

Pipeline::Pipeline(const Fetcher& fetcher, PipelineOptions opts)
    : fetcher_(fetcher), opts_(std::move(opts)) {}

void Pipeline::enter(PipelineState s) {
    state_.store(s);
    if (opts_.on_state) opts_.on_state(s);
}

size_t Pipeline::run(const std::string& title, const std::vector<std::string>& urls) {
    PipelineState expected = PipelineState::Idle;
    if (!state_.compare_exchange_strong(expected, PipelineState::Fetching)) {
        throw std::logic_error(std::string("pipeline already used (state: ") + to_string(expected) + ")");
    }
    if (opts_.on_state) opts_.on_state(PipelineState::Fetching);

    try {
        ImageCollector collector(fetcher_, opts_.collector);
        std::vector<Image> images = collector.collect(urls);

        enter(PipelineState::Collecting);

        enter(PipelineState::Archiving);
        PageResult page;
        page.title = title;
        page.archive = Archiver(opts_.method).pack(std::move(images));

        enter(PipelineState::Persisting);
        const size_t n = Persister(opts_.outdir, opts_.verbose).persist(page.title, page.archive);

        enter(PipelineState::Done);
        return n;
    } catch (...) {
        enter(PipelineState::Failed);
        throw;
    }
}

} // namespace pagezip
