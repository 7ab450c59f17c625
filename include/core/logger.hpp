/* SPDX-FileCopyrightText: 2025 LichtFeld Studio Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <format>
#include <iostream>
#include <memory>
#include <mutex>
#include <source_location>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <string>
#include <string_view>
#include <vector>

namespace mpe::core {

    // Console sink: "[hh:mm:ss.mmm] [level] file:line  message", perf lines tagged separately
    template <typename Mutex>
    class engine_console_sink : public spdlog::sinks::base_sink<Mutex> {
    public:
        engine_console_sink() {
            colors_[spdlog::level::trace] = "\033[37m";
            colors_[spdlog::level::debug] = "\033[36m";
            colors_[spdlog::level::info] = "\033[32m";
            colors_[spdlog::level::warn] = "\033[33m";
            colors_[spdlog::level::err] = "\033[31m";
            colors_[spdlog::level::critical] = "\033[1;31m";
            colors_[spdlog::level::off] = "\033[0m";
        }

    protected:
        void sink_it_(const spdlog::details::log_msg& msg) override {
            const auto time_t_val = std::chrono::system_clock::to_time_t(msg.time);
            const auto tm = *std::localtime(&time_t_val);
            const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                    msg.time.time_since_epoch())
                                    .count() %
                                1000;

            std::string_view full_path(msg.source.filename ? msg.source.filename : "");
            const auto last_slash = full_path.find_last_of("/\\");
            const std::string_view filename = (last_slash != std::string_view::npos)
                                                  ? full_path.substr(last_slash + 1)
                                                  : full_path;

            std::string_view payload(msg.payload.data(), msg.payload.size());
            std::string_view label = level_label(msg.level);
            std::string_view color = colors_[static_cast<size_t>(msg.level)];

            constexpr std::string_view PERF_PREFIX = "[PERF] ";
            if (payload.starts_with(PERF_PREFIX)) {
                payload.remove_prefix(PERF_PREFIX.size());
                label = "perf";
                color = PERF_COLOR;
            }

            std::cout << std::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}[{}]{} {}:{}  {}\n",
                                     tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(millis),
                                     color, label, RESET_COLOR,
                                     filename, msg.source.line, payload)
                      << std::flush;
        }

        void flush_() override {
            std::cout << std::flush;
        }

    private:
        static constexpr std::string_view PERF_COLOR = "\033[95m";
        static constexpr std::string_view RESET_COLOR = "\033[0m";

        static std::string_view level_label(const spdlog::level::level_enum level) {
            switch (level) {
            case spdlog::level::trace: return "trace";
            case spdlog::level::debug: return "debug";
            case spdlog::level::warn: return "warn";
            case spdlog::level::err: return "error";
            case spdlog::level::critical: return "critical";
            default: return "info";
            }
        }

        std::array<std::string, 7> colors_;
    };

    using engine_console_sink_mt = engine_console_sink<std::mutex>;

    enum class LogLevel : uint8_t {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Performance = 3,
        Warn = 4,
        Error = 5,
        Critical = 6,
        Off = 7
    };

    // Module detection from file path
    enum class LogModule : uint8_t {
        Core = 0,
        Paths = 1,
        Motion = 2,
        Camera = 3,
        Config = 4,
        Unknown = 5,
        Count = 6
    };

    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void init(LogLevel console_level = LogLevel::Info,
                  const std::string& log_file = "") {
            std::lock_guard lock(mutex_);

            std::vector<spdlog::sink_ptr> sinks;
            sinks.push_back(std::make_shared<engine_console_sink_mt>());

            if (!log_file.empty()) {
                auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, true);
                file_sink->set_level(spdlog::level::trace);
                file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %s:%# %v");
                sinks.push_back(file_sink);
            }

            logger_ = std::make_shared<spdlog::logger>("mpe", sinks.begin(), sinks.end());
            logger_->set_level(spdlog::level::trace);
            spdlog::set_default_logger(logger_);

            global_level_ = static_cast<uint8_t>(console_level);

            for (size_t i = 0; i < static_cast<size_t>(LogModule::Count); ++i) {
                module_enabled_[i] = true;
                module_level_[i] = static_cast<uint8_t>(LogLevel::Trace);
            }
        }

        template <typename... Args>
        void log_internal(LogLevel level, const std::source_location& loc,
                          std::format_string<Args...> fmt, Args&&... args) {
            if (!logger_)
                return;

            const auto module_idx = static_cast<size_t>(detect_module(loc.file_name()));
            if (!module_enabled_[module_idx] ||
                static_cast<uint8_t>(level) < module_level_[module_idx]) {
                return;
            }

            // Performance level shows only performance lines; otherwise perf lines are hidden
            const auto global_lvl = static_cast<LogLevel>(global_level_.load());
            if (global_lvl == LogLevel::Performance) {
                if (level != LogLevel::Performance)
                    return;
            } else if (level == LogLevel::Performance ||
                       static_cast<uint8_t>(level) < global_level_) {
                return;
            }

            auto msg = std::format(fmt, std::forward<Args>(args)...);
            if (level == LogLevel::Performance) {
                msg = "[PERF] " + msg;
            }

            logger_->log(
                spdlog::source_loc{loc.file_name(),
                                   static_cast<int>(loc.line()),
                                   loc.function_name()},
                to_spdlog_level(level),
                msg);
        }

        void enable_module(LogModule module, bool enabled = true) {
            module_enabled_[static_cast<size_t>(module)] = enabled;
        }

        void set_module_level(LogModule module, LogLevel level) {
            module_level_[static_cast<size_t>(module)] = static_cast<uint8_t>(level);
        }

        void set_level(LogLevel level) {
            global_level_ = static_cast<uint8_t>(level);
        }

        [[nodiscard]] LogLevel level() const {
            return static_cast<LogLevel>(global_level_.load());
        }

        void flush() {
            if (logger_)
                logger_->flush();
        }

    private:
        Logger() = default;

        static LogModule detect_module(std::string_view path) {
            if (path.find("paths") != std::string_view::npos)
                return LogModule::Paths;
            if (path.find("motion") != std::string_view::npos)
                return path.find("config_io") != std::string_view::npos ? LogModule::Config : LogModule::Motion;
            if (path.find("camera") != std::string_view::npos)
                return LogModule::Camera;
            if (path.find("core") != std::string_view::npos)
                return LogModule::Core;
            return LogModule::Unknown;
        }

        static constexpr spdlog::level::level_enum to_spdlog_level(LogLevel level) {
            switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info: return spdlog::level::info;
            case LogLevel::Performance: return spdlog::level::info;
            case LogLevel::Warn: return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Critical: return spdlog::level::critical;
            case LogLevel::Off: return spdlog::level::off;
            default: return spdlog::level::info;
            }
        }

        std::shared_ptr<spdlog::logger> logger_;
        mutable std::mutex mutex_;
        std::atomic<uint8_t> global_level_{static_cast<uint8_t>(LogLevel::Info)};
        std::array<std::atomic<bool>, static_cast<size_t>(LogModule::Count)> module_enabled_{};
        std::array<std::atomic<uint8_t>, static_cast<size_t>(LogModule::Count)> module_level_{};
    };

    // Scoped timer for performance measurement
    class ScopedTimer {
        std::chrono::high_resolution_clock::time_point start_;
        std::string name_;
        LogLevel level_;
        std::source_location loc_;

    public:
        explicit ScopedTimer(std::string name, LogLevel level = LogLevel::Performance,
                             std::source_location loc = std::source_location::current())
            : start_(std::chrono::high_resolution_clock::now()),
              name_(std::move(name)),
              level_(level),
              loc_(loc) {}

        ~ScopedTimer() {
            const auto duration = std::chrono::high_resolution_clock::now() - start_;
            const auto ms = std::chrono::duration<double, std::milli>(duration).count();
            Logger::get().log_internal(level_, loc_, "{} took {:.2f}ms", name_, ms);
        }
    };

} // namespace mpe::core

#define LOG_TRACE(...) \
    ::mpe::core::Logger::get().log_internal(::mpe::core::LogLevel::Trace, std::source_location::current(), __VA_ARGS__)

#define LOG_DEBUG(...) \
    ::mpe::core::Logger::get().log_internal(::mpe::core::LogLevel::Debug, std::source_location::current(), __VA_ARGS__)

#define LOG_INFO(...) \
    ::mpe::core::Logger::get().log_internal(::mpe::core::LogLevel::Info, std::source_location::current(), __VA_ARGS__)

#define LOG_PERF(...) \
    ::mpe::core::Logger::get().log_internal(::mpe::core::LogLevel::Performance, std::source_location::current(), __VA_ARGS__)

#define LOG_WARN(...) \
    ::mpe::core::Logger::get().log_internal(::mpe::core::LogLevel::Warn, std::source_location::current(), __VA_ARGS__)

#define LOG_ERROR(...) \
    ::mpe::core::Logger::get().log_internal(::mpe::core::LogLevel::Error, std::source_location::current(), __VA_ARGS__)

#define LOG_CRITICAL(...) \
    ::mpe::core::Logger::get().log_internal(::mpe::core::LogLevel::Critical, std::source_location::current(), __VA_ARGS__)

#define LOG_TIMER(name)       ::mpe::core::ScopedTimer _timer##__LINE__(name)
#define LOG_TIMER_DEBUG(name) ::mpe::core::ScopedTimer _timer##__LINE__(name, ::mpe::core::LogLevel::Debug)
