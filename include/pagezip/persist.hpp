#pragma once
#include "pagezip/image.hpp"

#include <string>
#include <utility>

namespace pagezip {

class Persister {
public:
    explicit Persister(std::string outdir = "downloads", bool verbose = true)
        : outdir_(std::move(outdir)), verbose_(verbose) {}

    // Writes <outdir>/<title>.zip, overwriting. Title must already be sanitized.
    size_t persist(const std::string& title, const Bytes& archive) const;
    std::string path_for(const std::string& title) const;

private:
    std::string outdir_;
    bool verbose_;
};

} // namespace pagezip
