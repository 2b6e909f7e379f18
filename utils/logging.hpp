#pragma once
#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <mutex>
#include <string>

namespace utils
{

    enum class LogLevel : int
    {
        Trace = 0,
        Debug = 1,
        Info = 2,
        Warn = 3,
        Error = 4,
        Fatal = 5,
        Off = 6
    };

    inline const char *to_string(LogLevel lvl)
    {
        switch (lvl)
        {
        case LogLevel::Trace:
            return "TRACE";
        case LogLevel::Debug:
            return "DEBUG";
        case LogLevel::Info:
            return "INFO";
        case LogLevel::Warn:
            return "WARN";
        case LogLevel::Error:
            return "ERROR";
        case LogLevel::Fatal:
            return "FATAL";
        default:
            return "OFF";
        }
    }

    // Accepts the usual spellings (WARNING/WARN, CRITICAL/FATAL), any case.
    inline bool parse_level(const std::string &s, LogLevel &out)
    {
        std::string v;
        v.reserve(s.size());
        for (char c : s)
            v.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));

        if (v == "TRACE")
            out = LogLevel::Trace;
        else if (v == "DEBUG")
            out = LogLevel::Debug;
        else if (v == "INFO")
            out = LogLevel::Info;
        else if (v == "WARN" || v == "WARNING")
            out = LogLevel::Warn;
        else if (v == "ERROR")
            out = LogLevel::Error;
        else if (v == "FATAL" || v == "CRITICAL")
            out = LogLevel::Fatal;
        else if (v == "OFF")
            out = LogLevel::Off;
        else
            return false;
        return true;
    }

    // Global state
    inline std::atomic<LogLevel> &global_level()
    {
        static std::atomic<LogLevel> lvl{LogLevel::Info};
        return lvl;
    }

    inline std::mutex &global_log_mutex()
    {
        static std::mutex m;
        return m;
    }

    inline std::ofstream &global_log_file()
    {
        static std::ofstream log_file;
        return log_file;
    }

    inline bool &log_to_file_enabled()
    {
        static bool enabled = false;
        return enabled;
    }

    inline void set_level(LogLevel lvl)
    {
        global_level().store(lvl);
    }

    inline bool open_log_file(const std::string &path)
    {
        std::lock_guard<std::mutex> lock(global_log_mutex());
        auto &f = global_log_file();
        if (f.is_open())
        {
            f.close();
        }

        f.open(path, std::ios::out | std::ios::app);
        if (!f.is_open())
        {
            std::fprintf(stderr, "[ERROR] Failed to open log file: %s\n", path.c_str());
            return false;
        }

        log_to_file_enabled() = true;
        std::fprintf(stderr, "[INFO] Logging to file: %s\n", path.c_str());
        return true;
    }

    inline void close_log_file()
    {
        std::lock_guard<std::mutex> lock(global_log_mutex());
        auto &f = global_log_file();
        if (f.is_open())
        {
            f.close();
        }
        log_to_file_enabled() = false;
    }

    inline void vlogf(LogLevel lvl, const char *fmt, va_list args)
    {
        const LogLevel current = global_level().load(std::memory_order_relaxed);
        if (lvl < current || current == LogLevel::Off)
            return;

        std::time_t t = std::time(nullptr);
        std::tm tm{};
        localtime_r(&t, &tm);

        char ts[32];
        std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d", tm.tm_hour, tm.tm_min, tm.tm_sec);

        char msg[1024];
        std::vsnprintf(msg, sizeof(msg), fmt, args);

        char log_line[1200];
        std::snprintf(log_line, sizeof(log_line), "[%s] %-5s: %s\n", ts, to_string(lvl), msg);

        // Receive loop and aggregator log concurrently; keep lines whole
        std::lock_guard<std::mutex> lock(global_log_mutex());
        std::fprintf(stderr, "%s", log_line);

        if (log_to_file_enabled())
        {
            auto &f = global_log_file();
            if (f.is_open())
            {
                f << log_line;
                f.flush();
            }
        }
    }

    inline void logf(LogLevel lvl, const char *fmt, ...)
    {
        va_list args;
        va_start(args, fmt);
        vlogf(lvl, fmt, args);
        va_end(args);
    }

} // namespace utils

// Convenience macros
#define LOG_TRACE(...) ::utils::logf(::utils::LogLevel::Trace, __VA_ARGS__)
#define LOG_DEBUG(...) ::utils::logf(::utils::LogLevel::Debug, __VA_ARGS__)
#define LOG_INFO(...) ::utils::logf(::utils::LogLevel::Info, __VA_ARGS__)
#define LOG_WARN(...) ::utils::logf(::utils::LogLevel::Warn, __VA_ARGS__)
#define LOG_ERROR(...) ::utils::logf(::utils::LogLevel::Error, __VA_ARGS__)
#define LOG_FATAL(...) ::utils::logf(::utils::LogLevel::Fatal, __VA_ARGS__)
