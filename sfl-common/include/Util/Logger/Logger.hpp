/*
    Licensed under the Apache License, Version 2.0 (the "License");
    you may not use this file except in compliance with the License.
    You may obtain a copy of the License at

        https://www.apache.org/licenses/LICENSE-2.0

    Unless required by applicable law or agreed to in writing, software
    distributed under the License is distributed on an "AS IS" BASIS,
    WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
    See the License for the specific language governing permissions and
    limitations under the License.
*/

#ifndef SFL_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
#define SFL_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
#include <Exceptions/RuntimeException.hpp>
#include <Util/Logger/LogLevel.hpp>
#include <Util/Logger/impl/SflLogger.hpp>
#include <iostream>
#include <magic_enum.hpp>
#include <memory>
#include <sstream>
namespace SFL {

// In the following we define the SFL_COMPILE_TIME_LOG_LEVEL macro.
// This macro indicates the log level, which was chooses at compilation time and enables the complete
// elimination of log messages.
#if defined(SFL_LOGLEVEL_TRACE)
#define SFL_COMPILE_TIME_LOG_LEVEL 7
#elif defined(SFL_LOGLEVEL_DEBUG)
#define SFL_COMPILE_TIME_LOG_LEVEL 6
#elif defined(SFL_LOGLEVEL_INFO)
#define SFL_COMPILE_TIME_LOG_LEVEL 5
#elif defined(SFL_LOGLEVEL_WARN)
#define SFL_COMPILE_TIME_LOG_LEVEL 4
#elif defined(SFL_LOGLEVEL_ERROR)
#define SFL_COMPILE_TIME_LOG_LEVEL 3
#elif defined(SFL_LOGLEVEL_FATAL_ERROR)
#define SFL_COMPILE_TIME_LOG_LEVEL 2
#elif defined(SFL_LOGLEVEL_NONE)
#define SFL_COMPILE_TIME_LOG_LEVEL 1
#else
#define SFL_COMPILE_TIME_LOG_LEVEL 7
#endif

/**
 * @brief GetLogLevel returns the integer LogLevel value for an specific LogLevel value.
 * @param value LogLevel
 * @return integer between 1 and 7 to identify the log level.
 */
constexpr uint64_t getLogLevel(const LogLevel value) { return magic_enum::enum_integer(value); }

/**
 * @brief LogCaller is our compile-time trampoline to invoke the Logger method for the desired level of logging L
 * @tparam L the level of logging
 */
template<LogLevel L>
struct LogCaller {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&&, fmt::format_string<arguments...>, arguments&&...) {
        // nop
    }
};

template<>
struct LogCaller<LogLevel::LOG_INFO> {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        SFL::Logger::getInstance().info(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_TRACE> {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        SFL::Logger::getInstance().trace(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_DEBUG> {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        SFL::Logger::getInstance().debug(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_ERROR> {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        SFL::Logger::getInstance().error(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_FATAL_ERROR> {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        SFL::Logger::getInstance().fatal(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

template<>
struct LogCaller<LogLevel::LOG_WARNING> {
    template<typename... arguments>
    constexpr static void do_call(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        SFL::Logger::getInstance().warn(std::move(loc), std::move(format), std::forward<arguments>(args)...);
    }
};

/// @brief the streaming logging macro, concatenates the message with <<
#define SFL_LOG(LEVEL, message)                                                                                                  \
    do {                                                                                                                         \
        auto constexpr __level = SFL::getLogLevel(LEVEL);                                                                        \
        if constexpr (SFL_COMPILE_TIME_LOG_LEVEL >= __level) {                                                                   \
            std::stringbuf __buffer;                                                                                             \
            std::ostream __os(&__buffer);                                                                                        \
            __os << message;                                                                                                     \
            SFL::LogCaller<LEVEL>::do_call(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, "{}", __buffer.str());       \
        }                                                                                                                        \
    } while (0)

/// @brief the fmt logging macro, takes a format string and its arguments; used for warnings and failures on hot paths
#define SFL_LOG2(LEVEL, ...)                                                                                                     \
    do {                                                                                                                         \
        auto constexpr __level = SFL::getLogLevel(LEVEL);                                                                        \
        if constexpr (SFL_COMPILE_TIME_LOG_LEVEL >= __level) {                                                                   \
            SFL::LogCaller<LEVEL>::do_call(spdlog::source_loc{__FILE__, __LINE__, SPDLOG_FUNCTION}, __VA_ARGS__);                \
        }                                                                                                                        \
    } while (0)

// Creates a log message with log level trace.
#define SFL_TRACE(...) SFL_LOG(SFL::LogLevel::LOG_TRACE, __VA_ARGS__);
// Creates a log message with log level info.
#define SFL_INFO(...) SFL_LOG(SFL::LogLevel::LOG_INFO, __VA_ARGS__);
// Creates a log message with log level debug.
#define SFL_DEBUG(...) SFL_LOG(SFL::LogLevel::LOG_DEBUG, __VA_ARGS__);
// Creates a log message with log level error.
#define SFL_ERROR(...) SFL_LOG(SFL::LogLevel::LOG_ERROR, __VA_ARGS__);

// Creates a log message with log level warning.
#define SFL_WARNING2(...) SFL_LOG2(SFL::LogLevel::LOG_WARNING, __VA_ARGS__);
// Creates a log message with log level error.
#define SFL_ERROR2(...) SFL_LOG2(SFL::LogLevel::LOG_ERROR, __VA_ARGS__);
// Creates a log message with log level fatal error.
#define SFL_FATAL_ERROR2(...) SFL_LOG2(SFL::LogLevel::LOG_FATAL_ERROR, __VA_ARGS__);

#define SFL_ASSERT(CONDITION, TEXT)                                                                                              \
    do {                                                                                                                         \
        if (!(CONDITION)) {                                                                                                      \
            SFL_ERROR("SFL Fatal Error on " #CONDITION << " message: " << TEXT);                                                 \
            std::stringbuf __buffer;                                                                                             \
            std::ostream __os(&__buffer);                                                                                        \
            __os << "Failed assertion on " #CONDITION;                                                                           \
            __os << " error message: " << TEXT;                                                                                  \
            throw SFL::Exceptions::RuntimeException(__buffer.str());                                                             \
        }                                                                                                                        \
    } while (0)

#define SFL_THROW_RUNTIME_ERROR(...)                                                                                             \
    do {                                                                                                                         \
        std::stringbuf __buffer;                                                                                                 \
        std::ostream __os(&__buffer);                                                                                            \
        __os << __VA_ARGS__;                                                                                                     \
        throw SFL::Exceptions::RuntimeException(__buffer.str());                                                                 \
    } while (0)

}// namespace SFL

#endif// SFL_COMMON_INCLUDE_UTIL_LOGGER_LOGGER_HPP_
