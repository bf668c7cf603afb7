#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace pysandbox::sandbox {

struct ProcessOptions {
    // argv[0] is resolved against PATH when it is not a path.
    std::vector<std::string> argv;
    std::string working_dir;
    std::chrono::milliseconds timeout{std::chrono::seconds(10)};
    // Time between SIGTERM and SIGKILL once the timeout fires.
    std::chrono::milliseconds grace{std::chrono::seconds(2)};
};

struct ProcessResult {
    bool launched = false;
    bool timed_out = false;
    int exit_code = -1;
    std::string output;
    std::string error;
};

class ProcessRunner {
public:
    static ProcessResult Run(const ProcessOptions& options);
};

}  // namespace pysandbox::sandbox
