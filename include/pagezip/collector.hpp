#pragma once
#include "pagezip/http.hpp"
#include "pagezip/image.hpp"

#include <string>
#include <vector>

namespace pagezip {

struct CollectorOptions {
    size_t max_parallel = 0;      // 0 = one thread per URL, all at once
    bool cancel_pending = false;  // skip fetches not yet started once one has failed
    bool verbose = true;
};

class ImageCollector {
public:
    explicit ImageCollector(const Fetcher& fetcher, CollectorOptions opts = {});

    // Fetches every URL concurrently. Returns one Image per URL in arrival
    // order, or rethrows the first failure once all tasks have finished.
    std::vector<Image> collect(const std::vector<std::string>& urls) const;

private:
    const Fetcher& fetcher_;
    CollectorOptions opts_;
};

} // namespace pagezip
