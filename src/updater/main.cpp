#include "updater/updater_cli.hpp"

int main(int argc, char* argv[]) {
    return UpdaterCLI::run(argc, argv);
}
