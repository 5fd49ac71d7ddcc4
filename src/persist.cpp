#include "pagezip/persist.hpp"
#include "pagezip/errors.hpp"
#include "pagezip/util.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <string>

namespace pagezip {

struct FileCloser {
    void operator()(std::FILE* f) const { std::fclose(f); }
};

std::string Persister::path_for(const std::string& title) const {
    return outdir_.empty() ? title + ".zip" : outdir_ + "/" + title + ".zip";
}

size_t Persister::persist(const std::string& title, const Bytes& archive) const {
    if (title.empty()) throw PersistFailure("empty title");

    if (verbose_) std::printf("Create directory\n");
    ensure_dir(outdir_);

    const std::string path = path_for(title);
    if (verbose_) std::printf("Create zip file\n");
    std::unique_ptr<std::FILE, FileCloser> fp(std::fopen(path.c_str(), "wb"));
    if (!fp) throw PersistFailure("cannot open output file: " + path + ": " + std::strerror(errno));

    if (verbose_) std::printf("Write zip file\n");
    const size_t n = archive.empty() ? 0 : std::fwrite(archive.data(), 1, archive.size(), fp.get());
    if (n != archive.size()) {
        throw PersistFailure("short write to " + path + ": " + std::to_string(n) + " of " +
                             std::to_string(archive.size()) + " bytes");
    }
    // fclose flushes; its failure means the tail of the file never reached the disk.
    if (std::fclose(fp.release()) != 0) {
        throw PersistFailure("cannot close " + path + ": " + std::strerror(errno));
    }

    if (verbose_) std::printf("✓ Saved: %s\n", path.c_str());
    return n;
}

} // namespace pagezip
