#include "pagezip/archiver.hpp"
#include "pagezip/errors.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace pagezip {

Bytes Archiver::pack(std::vector<Image> images) const {
    std::sort(images.begin(), images.end(),
              [](const Image& a, const Image& b) { return a.index < b.index; });

    ZipWriter zip(method_);
    for (auto& img : images) {
        zip.add(img.name, img.content);
        Bytes().swap(img.content);
    }
    return zip.finish();
}

} // namespace pagezip
