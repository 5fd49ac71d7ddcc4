#pragma once
#include <string>
#include <vector>

namespace pagezip {

struct Args {
    std::string title;
    std::vector<std::string> urls;
    std::string outdir = "downloads";
    size_t jobs = 0;
    bool store = false;
    bool cancel_pending = false;
    bool quiet = false;
};

class App {
public:
    int run(int argc, char** argv);
    // Throws std::invalid_argument on unknown options or missing title.
    static Args parse_args(int argc, char** argv);
private:
    static void usage(const char* prog);
};

} // namespace pagezip
