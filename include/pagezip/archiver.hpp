#pragma once
#include "pagezip/image.hpp"
#include "pagezip/zip.hpp"

#include <vector>

namespace pagezip {

class Archiver {
public:
    explicit Archiver(ZipWriter::Method method = ZipWriter::Method::Deflate) : method_(method) {}

    // Consumes the images; entries are laid out by original index.
    Bytes pack(std::vector<Image> images) const;

private:
    ZipWriter::Method method_;
};

} // namespace pagezip
