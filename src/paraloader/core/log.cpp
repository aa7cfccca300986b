// Copyright (c) 2026 changcheng967. All rights reserved.

#include <paraloader/core/log.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <iostream>

namespace paraloader::log {

void init(bool verbose, bool quiet) noexcept {
    try {
        auto logger = spdlog::stderr_color_mt("paraloader");
        logger->set_pattern("%Y-%m-%d %H:%M:%S.%e [%^%l%$] %v");
        spdlog::set_default_logger(logger);
    } catch (const spdlog::spdlog_ex& e) {
        // Logger already registered: keep it and only adjust the level
        std::cerr << "Logger setup: " << e.what() << std::endl;
    }

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

} // namespace paraloader::log
