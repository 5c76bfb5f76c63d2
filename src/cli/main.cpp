#include <iostream>
#include <string>
#include <vector>
#include "commands.h"
#include "config_paths.h"

using namespace facewatch;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string command = argv[1];

    if (command == "help" || command == "--help" || command == "-h") {
        print_usage();
        return 0;
    }

    if (command == "version" || command == "--version" || command == "-v") {
        std::cout << "facewatch version " << VERSION << std::endl;
        return 0;
    }

    if (command == "classifiers") {
        if (argc >= 3) {
            return cmd_classifiers(argv[2]);
        }
        return cmd_classifiers();
    }

    if (command == "image") {
        if (argc < 3) {
            std::cerr << "Error: image path required" << std::endl;
            std::cerr << "Usage: facewatch image <path> [--debug] [--output <file>] [--classifiers <dir>]" << std::endl;
            return 1;
        }
        std::vector<std::string> args;
        for (int i = 2; i < argc; i++) {
            args.push_back(argv[i]);
        }
        return cmd_image(args);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    print_usage();
    return 1;
}
