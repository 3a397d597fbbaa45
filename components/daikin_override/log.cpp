#include <cstdarg>
#include <cstdio>
#include <mutex>
#include "log.h"

namespace esphome
{
    namespace daikin_override
    {
        bool debug_log_messages = false;

        static LogHandler log_handler_;
        static std::mutex log_mutex_;

        void set_log_handler(LogHandler handler)
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            log_handler_ = std::move(handler);
        }

        void log_message(LogLevel level, const char *format, ...)
        {
            std::lock_guard<std::mutex> lock(log_mutex_);
            if (!log_handler_)
                return;

            char buffer[256];
            va_list args;
            va_start(args, format);
            int len = vsnprintf(buffer, sizeof(buffer), format, args);
            va_end(args);
            if (len < 0)
                return;

            std::string line;
            if (static_cast<size_t>(len) < sizeof(buffer))
            {
                line.assign(buffer, len);
            }
            else
            {
                // Long lines (event descriptions with many divergences) need a second pass
                line.resize(len + 1);
                va_start(args, format);
                vsnprintf(&line[0], line.size(), format, args);
                va_end(args);
                line.resize(len);
            }

            log_handler_(level, line);
        }

        const char *log_level_to_string(LogLevel level)
        {
            switch (level)
            {
            case LogLevel::Error:
                return "E";
            case LogLevel::Warn:
                return "W";
            case LogLevel::Info:
                return "I";
            case LogLevel::Debug:
                return "D";
            case LogLevel::Verbose:
                return "V";
            default:
                return "?";
            }
        }

    } // namespace daikin_override
} // namespace esphome
