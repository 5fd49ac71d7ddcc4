#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pagezip {

using Bytes = std::vector<std::uint8_t>;

struct Image {
    size_t index = 0;      // position of the source URL in the page's list
    std::string name;      // "<index>-<basename>", unique within a page
    Bytes content;
};

struct PageResult {
    std::string title;
    Bytes archive;
};

} // namespace pagezip
