#include "cli/CommandLine.hpp"

int main(int argc, char** argv) {
    return musician::cli::run(argc, argv);
}
