#include "pagezip/app.hpp"

int main(int argc, char** argv) {
    pagezip::App app;
    return app.run(argc, argv);
}
