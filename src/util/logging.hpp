// src/util/logging.hpp
#pragma once
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "../core/error.hpp"

namespace dprof {

// Installs the default logger: colored stderr, plus a file sink when
// `log_file` is non-empty.
inline void init_logging(const std::string& level, const std::string& log_file = {}) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!log_file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true));
        } catch (const spdlog::spdlog_ex& e) {
            throw configuration_error("cannot open log file " + log_file + ": " + e.what());
        }
    }
    auto logger = std::make_shared<spdlog::logger>("dprof", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [t%t] %v");
    logger->set_level(spdlog::level::from_str(level));
    spdlog::set_default_logger(logger);
}

}
