#include <exception>
#include <iostream>
#include <string>

#include <boost/asio/io_context.hpp>

#include "guest/guest_agent.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace {

void PrintUsage() {
    std::cout << "Usage: pysandbox-guest-agent [--port N] [--output-dir DIR] "
                 "[--interpreter PATH] [--unix PATH]"
              << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    pysandbox::guest::AgentOptions options{};
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            PrintUsage();
            return 0;
        }
        if (i + 1 >= argc) {
            PrintUsage();
            return 1;
        }
        const std::string value = argv[++i];
        if (arg == "--port") {
            try {
                options.port = std::stoi(value);
            } catch (const std::exception&) {
                std::cerr << "invalid port: " << value << std::endl;
                return 1;
            }
        } else if (arg == "--output-dir") {
            options.output_dir = value;
        } else if (arg == "--interpreter") {
            options.interpreter = value;
        } else if (arg == "--unix") {
            options.unix_path = value;
        } else {
            PrintUsage();
            return 1;
        }
    }

    pysandbox::utils::LogConfig log_config{};
    log_config.min_level = pysandbox::utils::ParseLogLevel(
        pysandbox::utils::GetEnv("PYSANDBOX_LOG_LEVEL"), pysandbox::utils::LogLevel::kInfo);
    pysandbox::utils::ApplyLogConfig(log_config);

    try {
        boost::asio::io_context io;
        pysandbox::guest::GuestAgent agent(options);
        agent.Run(io);
    } catch (const std::exception& e) {
        pysandbox::utils::Log(pysandbox::utils::LogLevel::kError, "agent") << "fatal: " << e.what();
        return 1;
    }
    return 0;
}
