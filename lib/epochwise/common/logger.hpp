#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <exception>
#include <functional>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#ifndef SPDLOG_FMT_EXTERNAL
#   define SPDLOG_FMT_EXTERNAL 1
#endif
#include <spdlog/spdlog.h>
#include "format.hpp"

namespace epochwise::logger {
    using level = spdlog::level::level_enum;

    // EPOCHWISE_LOG if set, otherwise log/epochwise.log relative to the working directory
    extern std::string log_path();
    // initialized from EPOCHWISE_DEBUG; lowers the logger's level to trace
    extern bool &tracing_enabled();
    // the process-wide logger, created on first use
    extern spdlog::logger &get();

    template<typename... Args>
    void log(const level lev, const std::string_view pattern, Args &&...args)
    {
        auto &l = get();
        if (l.should_log(lev))
            l.log(lev, fmt::format(fmt::runtime(pattern), std::forward<Args>(args)...));
    }

    template<typename... Args>
    void trace(const std::string_view pattern, Args &&...args) { log(level::trace, pattern, std::forward<Args>(args)...); }

    template<typename... Args>
    void debug(const std::string_view pattern, Args &&...args) { log(level::debug, pattern, std::forward<Args>(args)...); }

    template<typename... Args>
    void info(const std::string_view pattern, Args &&...args) { log(level::info, pattern, std::forward<Args>(args)...); }

    template<typename... Args>
    void warn(const std::string_view pattern, Args &&...args) { log(level::warn, pattern, std::forward<Args>(args)...); }

    template<typename... Args>
    void error(const std::string_view pattern, Args &&...args) { log(level::err, pattern, std::forward<Args>(args)...); }

    using action = std::function<void()>;
    using optional_action = std::optional<action>;

    // Runs main and then cleanup. An exception thrown by main is logged with the caller's location
    // and returned instead of being propagated.
    extern std::exception_ptr run_log_errors(const action &main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current());

    inline void run_log_errors_rethrow(const action &main, const optional_action &cleanup={},
        const std::source_location &loc=std::source_location::current())
    {
        if (auto failure = run_log_errors(main, cleanup, loc))
            std::rethrow_exception(std::move(failure));
    }
}
