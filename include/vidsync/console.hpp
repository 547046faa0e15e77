#pragma once

#include <ostream>
#include <streambuf>

namespace vidsync {

// While active, std::cout writes land on stderr; stdout_stream() still
// reaches the real stdout. Used when stdout carries the JSON result.
class StdoutDiversion {
public:
    explicit StdoutDiversion(bool active);
    ~StdoutDiversion();

    StdoutDiversion(const StdoutDiversion&) = delete;
    StdoutDiversion& operator=(const StdoutDiversion&) = delete;

    std::ostream& stdout_stream() { return stdout_; }

private:
    std::streambuf* saved_ = nullptr;
    std::ostream stdout_;
};

} // namespace vidsync
