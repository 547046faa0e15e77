#include "vidsync/console.hpp"
#include <iostream>

namespace vidsync {

StdoutDiversion::StdoutDiversion(bool active)
    : stdout_(std::cout.rdbuf()) {
    if (active) {
        std::cout.flush();
        saved_ = std::cout.rdbuf(std::cerr.rdbuf());
    }
}

StdoutDiversion::~StdoutDiversion() {
    stdout_.flush();
    if (saved_) {
        std::cout.rdbuf(saved_);
    }
}

} // namespace vidsync
