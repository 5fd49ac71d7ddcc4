#include "pagezip/zip.hpp"
#include "pagezip/errors.hpp"

#include <zlib.h>

#include <cstdint>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace pagezip {

static constexpr std::uint32_t kLocalSig   = 0x04034b50;
static constexpr std::uint32_t kCentralSig = 0x02014b50;
static constexpr std::uint32_t kEndSig     = 0x06054b50;
static constexpr std::uint16_t kVersion    = 20;
static constexpr std::uint16_t kUtf8Flag   = 0x0800;
// MS-DOS date for 1980-01-01, time 00:00:00.
static constexpr std::uint16_t kDosDate    = (0 << 9) | (1 << 5) | 1;
static constexpr std::uint16_t kDosTime    = 0;
static constexpr size_t kLocalHeaderSize   = 30;
static constexpr size_t kCentralHeaderSize = 46;
static constexpr size_t kEndRecordSize     = 22;
static constexpr std::uint64_t kMax32      = std::numeric_limits<std::uint32_t>::max();

static void put16(Bytes& b, std::uint16_t v) {
    b.push_back(static_cast<std::uint8_t>(v));
    b.push_back(static_cast<std::uint8_t>(v >> 8));
}

static void put32(Bytes& b, std::uint32_t v) {
    for (int i = 0; i < 4; ++i) b.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

static std::uint16_t get16(const Bytes& b, size_t at) {
    if (at + 2 > b.size()) throw ArchiveFailure("truncated archive");
    return static_cast<std::uint16_t>(b[at] | (b[at + 1] << 8));
}

static std::uint32_t get32(const Bytes& b, size_t at) {
    if (at + 4 > b.size()) throw ArchiveFailure("truncated archive");
    return static_cast<std::uint32_t>(b[at]) | (static_cast<std::uint32_t>(b[at + 1]) << 8) |
           (static_cast<std::uint32_t>(b[at + 2]) << 16) | (static_cast<std::uint32_t>(b[at + 3]) << 24);
}

static std::uint32_t crc_of(const Bytes& data) {
    const uLong init = crc32(0L, Z_NULL, 0);
    return static_cast<std::uint32_t>(crc32(init, data.empty() ? Z_NULL : data.data(),
                                            static_cast<uInt>(data.size())));
}

static Bytes deflate_raw(const Bytes& in) {
    z_stream zs{};
    if (deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        throw ArchiveFailure("deflateInit2 failed");
    }
    Bytes out(deflateBound(&zs, static_cast<uLong>(in.size())));
    zs.next_in = const_cast<Bytef*>(in.data());
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    const int rc = deflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    deflateEnd(&zs);
    if (rc != Z_STREAM_END) throw ArchiveFailure("deflate failed");
    out.resize(produced);
    return out;
}

static Bytes inflate_raw(const std::uint8_t* in, size_t n, size_t expected) {
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) throw ArchiveFailure("inflateInit2 failed");
    // One spare byte keeps next_out non-null for empty entries and catches overlong streams.
    Bytes out(expected + 1);
    zs.next_in = const_cast<Bytef*>(in);
    zs.avail_in = static_cast<uInt>(n);
    zs.next_out = out.data();
    zs.avail_out = static_cast<uInt>(out.size());
    const int rc = inflate(&zs, Z_FINISH);
    const uLong produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != expected) throw ArchiveFailure("corrupt deflate stream");
    out.resize(expected);
    return out;
}

void ZipWriter::add(const std::string& name, const Bytes& data) {
    if (finished_) throw ArchiveFailure("archive already finished");
    if (name.empty()) throw ArchiveFailure("empty entry name");
    if (name.size() > 0xffff) throw ArchiveFailure("entry name too long: " + name.substr(0, 64));
    if (names_.count(name)) throw ArchiveFailure("duplicate entry: " + name);
    if (entries_.size() >= 0xffff) throw ArchiveFailure("too many entries");
    if (data.size() > kMax32) throw ArchiveFailure("entry too large: " + name);

    Entry e;
    e.name = name;
    e.method = static_cast<std::uint16_t>(method_);
    e.crc = crc_of(data);
    e.size = static_cast<std::uint32_t>(data.size());

    const Bytes packed = (method_ == Method::Deflate) ? deflate_raw(data) : Bytes();
    const Bytes& payload = (method_ == Method::Deflate) ? packed : data;
    if (out_.size() + kLocalHeaderSize + name.size() + payload.size() > kMax32) {
        throw ArchiveFailure("archive exceeds 4 GiB");
    }
    e.compressed_size = static_cast<std::uint32_t>(payload.size());
    e.offset = static_cast<std::uint32_t>(out_.size());

    put32(out_, kLocalSig);
    put16(out_, kVersion);
    put16(out_, kUtf8Flag);
    put16(out_, e.method);
    put16(out_, kDosTime);
    put16(out_, kDosDate);
    put32(out_, e.crc);
    put32(out_, e.compressed_size);
    put32(out_, e.size);
    put16(out_, static_cast<std::uint16_t>(name.size()));
    put16(out_, 0);
    out_.insert(out_.end(), name.begin(), name.end());
    out_.insert(out_.end(), payload.begin(), payload.end());

    names_.insert(name);
    entries_.push_back(std::move(e));
}

Bytes ZipWriter::finish() {
    if (finished_) throw ArchiveFailure("archive already finished");
    const size_t cd_offset = out_.size();
    for (const auto& e : entries_) {
        put32(out_, kCentralSig);
        put16(out_, kVersion);
        put16(out_, kVersion);
        put16(out_, kUtf8Flag);
        put16(out_, e.method);
        put16(out_, kDosTime);
        put16(out_, kDosDate);
        put32(out_, e.crc);
        put32(out_, e.compressed_size);
        put32(out_, e.size);
        put16(out_, static_cast<std::uint16_t>(e.name.size()));
        put16(out_, 0);   // extra
        put16(out_, 0);   // comment
        put16(out_, 0);   // disk
        put16(out_, 0);   // internal attrs
        put32(out_, 0);   // external attrs
        put32(out_, e.offset);
        out_.insert(out_.end(), e.name.begin(), e.name.end());
    }
    const size_t cd_size = out_.size() - cd_offset;
    if (out_.size() + kEndRecordSize > kMax32) throw ArchiveFailure("archive exceeds 4 GiB");

    put32(out_, kEndSig);
    put16(out_, 0);
    put16(out_, 0);
    put16(out_, static_cast<std::uint16_t>(entries_.size()));
    put16(out_, static_cast<std::uint16_t>(entries_.size()));
    put32(out_, static_cast<std::uint32_t>(cd_size));
    put32(out_, static_cast<std::uint32_t>(cd_offset));
    put16(out_, 0);

    finished_ = true;
    entries_.clear();
    names_.clear();
    Bytes blob;
    blob.swap(out_);
    return blob;
}

std::vector<ZipReader::Entry> ZipReader::read(const Bytes& archive) {
    if (archive.size() < kEndRecordSize) throw ArchiveFailure("not a zip archive");

    // The end record sits at the tail, followed by a comment of at most 64 KiB.
    size_t end = std::string::npos;
    const size_t lowest = archive.size() > kEndRecordSize + 0xffff ? archive.size() - kEndRecordSize - 0xffff : 0;
    for (size_t at = archive.size() - kEndRecordSize + 1; at-- > lowest;) {
        if (get32(archive, at) == kEndSig) { end = at; break; }
    }
    if (end == std::string::npos) throw ArchiveFailure("end of central directory not found");

    const std::uint16_t count = get16(archive, end + 10);
    size_t at = get32(archive, end + 16);

    std::vector<Entry> out;
    out.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        if (get32(archive, at) != kCentralSig) throw ArchiveFailure("bad central directory entry");
        const std::uint16_t method = get16(archive, at + 10);
        const std::uint32_t crc = get32(archive, at + 16);
        const std::uint32_t csize = get32(archive, at + 20);
        const std::uint32_t usize = get32(archive, at + 24);
        const std::uint16_t name_len = get16(archive, at + 28);
        const std::uint16_t extra_len = get16(archive, at + 30);
        const std::uint16_t comment_len = get16(archive, at + 32);
        const std::uint32_t local = get32(archive, at + 42);
        if (at + kCentralHeaderSize + name_len > archive.size()) throw ArchiveFailure("truncated archive");

        Entry e;
        e.name.assign(archive.begin() + at + kCentralHeaderSize,
                      archive.begin() + at + kCentralHeaderSize + name_len);
        at += kCentralHeaderSize + name_len + extra_len + comment_len;

        if (get32(archive, local) != kLocalSig) throw ArchiveFailure("bad local header: " + e.name);
        const size_t data_at = local + kLocalHeaderSize + get16(archive, local + 26) + get16(archive, local + 28);
        if (data_at + csize > archive.size()) throw ArchiveFailure("truncated entry: " + e.name);
        const std::uint8_t* p = archive.data() + data_at;

        if (method == static_cast<std::uint16_t>(ZipWriter::Method::Store)) {
            if (csize != usize) throw ArchiveFailure("size mismatch: " + e.name);
            e.data.assign(p, p + csize);
        } else if (method == static_cast<std::uint16_t>(ZipWriter::Method::Deflate)) {
            e.data = inflate_raw(p, csize, usize);
        } else {
            throw ArchiveFailure("unsupported compression method " + std::to_string(method) + ": " + e.name);
        }
        if (crc_of(e.data) != crc) throw ArchiveFailure("CRC mismatch: " + e.name);
        out.push_back(std::move(e));
    }
    return out;
}

} // namespace pagezip
