#include <iostream>
#include "commands.h"
#include "config_paths.h"

namespace facewatch {

void print_usage() {
    std::cout << "facewatch - face recognition notifications" << std::endl;
    std::cout << "Version: " << VERSION << std::endl << std::endl;
    std::cout << "Usage: facewatch <command> [options]" << std::endl << std::endl;
    std::cout << "Commands:" << std::endl;
    std::cout << "  classifiers [directory]                      Load and describe a classifier ensemble" << std::endl;
    std::cout << "  image <path> [--debug] [--output <file>]     Recognize faces in a still image" << std::endl;
    std::cout << "        [--classifiers <directory>]" << std::endl;
    std::cout << "  version                                      Show version information" << std::endl;
    std::cout << "  help                                         Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  facewatch classifiers                               # Check the configured ensemble" << std::endl;
    std::cout << "  facewatch classifiers /tmp/classifiers              # Check a new ensemble before install" << std::endl;
    std::cout << "  facewatch image office.jpg                          # Who is in this picture?" << std::endl;
    std::cout << "  facewatch image office.jpg --debug --output out.jpg # Per-classifier scores, annotated copy" << std::endl;
    std::cout << std::endl;
    std::cout << "The daemon (facewatchd) accepts commands on 127.0.0.1:43210:" << std::endl;
    std::cout << "  echo reload | nc -q1 127.0.0.1 43210                # Reload classifiers" << std::endl;
    std::cout << "  echo 'debug on' | nc -q1 127.0.0.1 43210            # Debug lines for every face" << std::endl;
    std::cout << "  echo status | nc -q1 127.0.0.1 43210" << std::endl;
}

} // namespace facewatch
