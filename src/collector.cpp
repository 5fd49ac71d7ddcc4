#include "pagezip/collector.hpp"
#include "pagezip/errors.hpp"
#include "pagezip/sync.hpp"
#include "pagezip/util.hpp"

#include <atomic>
#include <cstdio>
#include <exception>
#include <future>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace pagezip {

namespace {

// What a fetch task hands to the aggregator: an image, an error, or
// nothing at all when the task was skipped after an earlier failure.
struct Outcome {
    size_t index = 0;
    std::optional<Image> image;
    std::exception_ptr error;
};

} // namespace

ImageCollector::ImageCollector(const Fetcher& fetcher, CollectorOptions opts)
    : fetcher_(fetcher), opts_(opts) {}

std::vector<Image> ImageCollector::collect(const std::vector<std::string>& urls) const {
    for (size_t i = 0; i < urls.size(); ++i) {
        if (urls[i].empty()) {
            throw InvalidReference("image " + std::to_string(i) + ": <img> does not have attribute `src`");
        }
    }
    if (opts_.verbose) std::printf("%zu images.\n", urls.size());

    Channel<Outcome> done;
    std::promise<std::vector<Image>> result;
    std::future<std::vector<Image>> collected = result.get_future();

    // The aggregator is the only thread that touches the result list. It
    // finishes when the channel is closed, which happens after every task
    // has pushed its outcome.
    std::thread aggregator([&done, &result] {
        std::vector<Image> xs;
        std::exception_ptr first_error;
        while (auto o = done.pop()) {
            if (o->error) {
                if (!first_error) {
                    first_error = o->error;
                    xs.clear();
                }
            } else if (o->image && !first_error) {
                xs.push_back(std::move(*o->image));
            }
        }
        if (first_error) result.set_exception(first_error);
        else result.set_value(std::move(xs));
    });

    WaitGroup wg;
    Semaphore slots(opts_.max_parallel);
    std::atomic<bool> failed{false};
    std::vector<std::thread> workers;
    workers.reserve(urls.size());

    for (size_t i = 0; i < urls.size(); ++i) {
        slots.acquire();
        wg.add();
        try {
            workers.emplace_back([this, &urls, &done, &wg, &slots, &failed, i] {
                Outcome o;
                o.index = i;
                const std::string& url = urls[i];
                if (!(opts_.cancel_pending && failed.load())) {
                    if (opts_.verbose) std::printf("START [%zu] %s\n", i, url.c_str());
                    try {
                        Image img;
                        img.index = i;
                        img.name = std::to_string(i) + "-" + basename_of(url);
                        img.content = fetcher_.fetch(url);
                        o.image = std::move(img);
                    } catch (...) {
                        o.error = std::current_exception();
                        failed = true;
                    }
                    if (opts_.verbose) std::printf("DONE [%zu] %s\n", i, url.c_str());
                }
                done.push(std::move(o));
                slots.release();
                wg.done();
            });
        } catch (const std::exception&) {
            // Thread could not be started: report it like a failed fetch and stop launching.
            Outcome o;
            o.index = i;
            o.error = std::current_exception();
            failed = true;
            done.push(std::move(o));
            slots.release();
            wg.done();
            break;
        }
    }

    wg.wait();
    done.close();
    for (auto& t : workers) t.join();
    aggregator.join();

    return collected.get();
}

} // namespace pagezip
