/* This file is part of Epochwise project.
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in the LICENSE file. */

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <vector>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include "logger.hpp"

namespace epochwise::logger {
    namespace {
        spdlog::sink_ptr make_file_sink(const std::string &path)
        {
            if (const auto dir = std::filesystem::path { path }.parent_path(); !dir.empty())
                std::filesystem::create_directories(dir);
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path);
            sink->set_level(level::trace);
            sink->set_pattern("[%Y-%m-%d %T.%e] [%t] [%l] %v");
            return sink;
        }

        spdlog::sink_ptr make_console_sink()
        {
            auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            sink->set_level(level::info);
            sink->set_pattern("[%^%l%$] %v");
            return sink;
        }

        spdlog::logger create()
        {
            std::vector<spdlog::sink_ptr> sinks { make_file_sink(log_path()) };
            if (!std::getenv("EPOCHWISE_LOG_NO_CONSOLE"))
                sinks.emplace_back(make_console_sink());
            spdlog::logger l { "epochwise", sinks.begin(), sinks.end() };
            l.set_level(tracing_enabled() ? level::trace : level::debug);
            // the fatal paths flush explicitly before terminating
            l.flush_on(level::info);
            return l;
        }
    }

    std::string log_path()
    {
        if (const char *path = std::getenv("EPOCHWISE_LOG"))
            return path;
        return "log/epochwise.log";
    }

    bool &tracing_enabled()
    {
        static bool enabled = std::getenv("EPOCHWISE_DEBUG") != nullptr;
        return enabled;
    }

    spdlog::logger &get()
    {
        static spdlog::logger instance = create();
        return instance;
    }

    std::exception_ptr run_log_errors(const action &main, const optional_action &cleanup, const std::source_location &loc)
    {
        std::exception_ptr failure {};
        try {
            main();
        } catch (const std::exception &ex) {
            failure = std::current_exception();
            error("{}:{}: {}", loc.file_name(), loc.line(), ex.what());
        } catch (...) {
            failure = std::current_exception();
            error("{}:{}: a non-standard exception", loc.file_name(), loc.line());
        }
        if (cleanup)
            (*cleanup)();
        return failure;
    }
}
