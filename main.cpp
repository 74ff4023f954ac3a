#include "sync/command_line.hpp"

int main(int argc, char** argv) {
    CommandLine commandLine;
    return commandLine.run(argc, argv);
}
