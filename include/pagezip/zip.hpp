#pragma once
#include "pagezip/image.hpp"

#include <cstdint>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace pagezip {

// In-memory ZIP writer. Timestamps are fixed, so the output depends only on
// the entries added and their order.
class ZipWriter {
public:
    enum class Method : std::uint16_t { Store = 0, Deflate = 8 };

    explicit ZipWriter(Method method = Method::Deflate) : method_(method) {}

    // Throws ArchiveFailure on empty/duplicate name or size limits.
    void add(const std::string& name, const Bytes& data);
    // Appends the central directory and returns the archive. The writer is spent afterwards.
    Bytes finish();

    size_t entry_count() const { return entries_.size(); }

private:
    struct Entry {
        std::string name;
        std::uint16_t method;
        std::uint32_t crc;
        std::uint32_t compressed_size;
        std::uint32_t size;
        std::uint32_t offset;
    };

    Method method_;
    Bytes out_;
    std::vector<Entry> entries_;
    std::set<std::string> names_;
    bool finished_ = false;
};

class ZipReader {
public:
    struct Entry {
        std::string name;
        Bytes data;
    };

    // Parses a whole archive, verifying each entry's CRC. Throws ArchiveFailure.
    static std::vector<Entry> read(const Bytes& archive);
};

} // namespace pagezip
