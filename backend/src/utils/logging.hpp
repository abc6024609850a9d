#pragma once
#include <string>
#include <vector>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace Log
{
    // Install the engine logger: file sink always, stderr console when requested.
    // Call once from main(); library code only uses the spdlog:: free functions.
    inline void init(const std::string& file = "logs/aqualog.log",
                     const std::string& level = "info",
                     bool console = false)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file));
        if (console)
            sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

        auto logger = std::make_shared<spdlog::logger>("aqualog", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);

        // Set global log pattern ONCE
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");

        spdlog::set_level(spdlog::level::from_str(level));
        spdlog::flush_on(spdlog::level::info);
    }
}
