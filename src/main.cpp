#include "docguard/cli/app.hpp"

int main(int argc, char** argv) {
    docguard::cli::App app;
    return app.run(argc, argv);
}
