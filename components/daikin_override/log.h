#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace esphome
{
    namespace daikin_override
    {
        enum class LogLevel : uint8_t
        {
            Error = 0,
            Warn = 1,
            Info = 2,
            Debug = 3,
            Verbose = 4
        };

        using LogHandler = std::function<void(LogLevel level, const std::string &message)>;

        // Replaces the sink all LOGx lines are handed to. An empty handler drops every line.
        // The firmware component forwards to the ESPHome logger, tests capture the lines.
        void set_log_handler(LogHandler handler);

        void log_message(LogLevel level, const char *format, ...) __attribute__((format(printf, 2, 3)));

        const char *log_level_to_string(LogLevel level);

        // Gates the chatty per-field messages (intent bookkeeping, suppression reasons)
        extern bool debug_log_messages;

#define LOGE(...) ::esphome::daikin_override::log_message(::esphome::daikin_override::LogLevel::Error, __VA_ARGS__)
#define LOGW(...) ::esphome::daikin_override::log_message(::esphome::daikin_override::LogLevel::Warn, __VA_ARGS__)
#define LOGI(...) ::esphome::daikin_override::log_message(::esphome::daikin_override::LogLevel::Info, __VA_ARGS__)
#define LOGD(...) ::esphome::daikin_override::log_message(::esphome::daikin_override::LogLevel::Debug, __VA_ARGS__)
#define LOGV(...) ::esphome::daikin_override::log_message(::esphome::daikin_override::LogLevel::Verbose, __VA_ARGS__)

    } // namespace daikin_override
} // namespace esphome
