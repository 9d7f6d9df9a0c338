#pragma once
/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <chrono>
#include <exception>
#include <optional>
#include <string>
#include "logger.hpp"

namespace epochwise {
    // Logs the time between its construction and destruction unless stopped silently
    struct timer {
        using clock = std::chrono::steady_clock;

        explicit timer(const std::string_view title, const logger::level lev=logger::level::trace):
            _title { title }, _level { lev }, _start { clock::now() }
        {
            if (logger::tracing_enabled())
                logger::log(_level, "{} started", _title);
        }

        ~timer()
        {
            if (!_silent)
                logger::log(_level, "{} {} after {:0.3f} secs", _title, std::uncaught_exceptions() ? "failed" : "finished", stop());
        }

        double stop(const bool report=true)
        {
            if (!_end)
                _end = clock::now();
            _silent = !report;
            return std::chrono::duration<double> { *_end - _start }.count();
        }
    private:
        const std::string _title;
        const logger::level _level;
        const clock::time_point _start;
        std::optional<clock::time_point> _end {};
        bool _silent = false;
    };
}
