#pragma once
#include "pagezip/collector.hpp"
#include "pagezip/http.hpp"
#include "pagezip/zip.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace pagezip {

enum class PipelineState {
    Idle,
    Fetching,
    Collecting,
    Archiving,
    Persisting,
    Done,
    Failed
};

const char* to_string(PipelineState s);

struct PipelineOptions {
    CollectorOptions collector;
    ZipWriter::Method method = ZipWriter::Method::Deflate;
    std::string outdir = "downloads";
    bool verbose = true;
    std::function<void(PipelineState)> on_state;
};

// One page: collect images, archive them, persist the archive. Single use.
class Pipeline {
public:
    explicit Pipeline(const Fetcher& fetcher, PipelineOptions opts = {});

    // Returns the number of bytes written. On failure the state is Failed and the error is rethrown.
    size_t run(const std::string& title, const std::vector<std::string>& urls);

    PipelineState state() const { return state_.load(); }

private:
    void enter(PipelineState s);

    const Fetcher& fetcher_;
    PipelineOptions opts_;
    std::atomic<PipelineState> state_{PipelineState::Idle};
};

} // namespace pagezip
