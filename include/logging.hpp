#pragma once
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <memory>
#include <string>
#include <vector>

namespace itemstore {

class Logger {
public:
    static constexpr const char* NAME = "itemstore";

    static void init(const std::string& log_level = "info", const std::string& file_path = "") {
        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        std::vector<spdlog::sink_ptr> sinks{console_sink};

        if (!file_path.empty()) {
            auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
            sinks.push_back(file_sink);
        }

        auto logger = std::make_shared<spdlog::logger>(NAME, sinks.begin(), sinks.end());

        if (log_level == "debug") {
            logger->set_level(spdlog::level::debug);
        } else if (log_level == "warn") {
            logger->set_level(spdlog::level::warn);
        } else if (log_level == "error") {
            logger->set_level(spdlog::level::err);
        } else {
            logger->set_level(spdlog::level::info);
        }

        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    }

    // Falls back to an info-level console logger if init() was never called
    static spdlog::logger& get() {
        auto logger = spdlog::get(NAME);
        if (!logger) {
            init();
            logger = spdlog::get(NAME);
        }
        return *logger;
    }
};

} // namespace itemstore
