#include "obfuscator/cli/app.hpp"

int main(int argc, char** argv) {
    obfuscator::cli::App app;
    return app.run(argc, argv);
}
