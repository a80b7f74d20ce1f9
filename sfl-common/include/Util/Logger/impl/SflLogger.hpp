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

#ifndef SFL_COMMON_INCLUDE_UTIL_LOGGER_IMPL_SFLLOGGER_HPP_
#define SFL_COMMON_INCLUDE_UTIL_LOGGER_IMPL_SFLLOGGER_HPP_

#include <Util/Logger/LogLevel.hpp>
#include <atomic>
#include <memory>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <string>

namespace spdlog::details {
class thread_pool;
class periodic_worker;
}// namespace spdlog::details

namespace SFL {
namespace detail {

/**
 * @brief The logger of SessionFlow. It wraps an asynchronous spdlog logger that writes to the console and to a log file.
 * Until configure is called, all messages go to an empty logger.
 */
class Logger {
  public:
    explicit Logger();

    ~Logger();

    Logger(const Logger&) = delete;

    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Configures this logger with a file sink at logFileName and the given log level
     * @param logFileName path of the log file
     * @param level the log level
     */
    void configure(const std::string& logFileName, LogLevel level);

    /**
     * @brief flushes all sinks and releases the background workers. Further log calls are dropped.
     */
    void shutdown();

    /**
     * @brief flushes all sinks synchronously
     */
    void forceFlush();

    /**
     * @brief changes the log level of the logger and of all of its sinks
     * @param newLevel
     */
    void changeLogLevel(LogLevel newLevel);

    [[nodiscard]] LogLevel getCurrentLogLevel() const { return currentLogLevel; }

    template<typename... arguments>
    void trace(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::trace, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    void debug(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::debug, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    void info(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::info, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    void warn(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::warn, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    void error(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::err, format, std::forward<arguments>(args)...);
        }
    }

    template<typename... arguments>
    void fatal(spdlog::source_loc&& loc, fmt::format_string<arguments...> format, arguments&&... args) {
        if (impl) {
            impl->log(std::move(loc), spdlog::level::critical, format, std::forward<arguments>(args)...);
        }
    }

  private:
    std::shared_ptr<spdlog::logger> impl{nullptr};
    std::shared_ptr<spdlog::details::thread_pool> loggerThreadPool{nullptr};
    std::unique_ptr<spdlog::details::periodic_worker> flusher{nullptr};
    LogLevel currentLogLevel = LogLevel::LOG_INFO;
    std::atomic<bool> isShutdown{false};
};
}// namespace detail

namespace Logger {
/**
 * @brief Configures the global logger
 * @param logFileName the file to log into
 * @param level the log level
 */
void setupLogging(const std::string& logFileName, LogLevel level);

/**
 * @return the global logger instance
 */
detail::Logger& getInstance();
}// namespace Logger

}// namespace SFL

#endif// SFL_COMMON_INCLUDE_UTIL_LOGGER_IMPL_SFLLOGGER_HPP_
