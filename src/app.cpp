#include "pagezip/app.hpp"
#include "pagezip/http.hpp"
#include "pagezip/persist.hpp"
#include "pagezip/pipeline.hpp"
#include "pagezip/util.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pagezip {

void App::usage(const char* prog) {
    std::cerr <<
        "Usage:\n"
        "  " << prog << " [--out downloads] [--jobs 0] [--store] [--cancel-pending] [--quiet]"
        " <title> [image_url...]\n\n"
        "Examples:\n"
        "  " << prog << " \"My Gallery\" https://example.com/a.png https://example.com/b.jpg\n"
        "  " << prog << " --jobs 8 --out archive Page_1 https://example.com/img/1.png\n";
}

static size_t parse_jobs(const std::string& v) {
    size_t used = 0;
    const long long n = std::stoll(v, &used);
    if (used != v.size() || n < 0) throw std::invalid_argument("--jobs expects a non-negative integer: " + v);
    return static_cast<size_t>(n);
}

Args App::parse_args(int argc, char** argv) {
    Args a;
    bool have_title = false;
    for (int i=1; i<argc; ++i) {
        std::string k = argv[i];
        if (k=="--out" && i+1<argc) { a.outdir = argv[++i]; }
        else if (k=="--jobs" && i+1<argc) { a.jobs = parse_jobs(argv[++i]); }
        else if (k=="--store") { a.store = true; }
        else if (k=="--cancel-pending") { a.cancel_pending = true; }
        else if (k=="--quiet") { a.quiet = true; }
        else if (k.rfind("--", 0) == 0) { throw std::invalid_argument("Unknown arg: " + k); }
        else if (!have_title) { a.title = k; have_title = true; }
        else { a.urls.push_back(k); }
    }
    if (!have_title) throw std::invalid_argument("missing title");
    return a;
}

int App::run(int argc, char** argv) {
    Args args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        usage(argc > 0 ? argv[0] : "pagezip");
        return 1;
    }

    try {
        const std::string title = sanitize_title(args.title);
        if (title.empty()) throw std::invalid_argument("Failed to get title");

        HttpClient http;
        PipelineOptions opts;
        opts.collector.max_parallel = args.jobs;
        opts.collector.cancel_pending = args.cancel_pending;
        opts.collector.verbose = !args.quiet;
        opts.method = args.store ? ZipWriter::Method::Store : ZipWriter::Method::Deflate;
        opts.outdir = args.outdir;
        opts.verbose = !args.quiet;

        Pipeline pipeline(http, opts);
        const size_t n = pipeline.run(title, args.urls);
        if (!args.quiet) {
            std::cout << "Done. " << args.urls.size() << " images, " << n << " bytes -> "
                      << Persister(args.outdir).path_for(title) << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    }
}

} // namespace pagezip
