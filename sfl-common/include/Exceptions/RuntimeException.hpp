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

#ifndef SFL_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_
#define SFL_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_

#include <exception>
#include <source_location>
#include <string>

namespace SFL::Exceptions {

/**
 * @brief Exception to be used to report errors and stop the execution.
 * The message is logged together with the location that raised the exception.
 */
class RuntimeException : public std::exception {
  public:
    /**
     * @brief Construct a RuntimeException from a message and the location it was raised at
     * @param msg the exception message
     * @param location the source location
     */
    explicit RuntimeException(std::string msg, const std::source_location location = std::source_location::current());

    ~RuntimeException() noexcept override = default;

    /**
     * @brief Returns the error message
     * @return the error message
     */
    [[nodiscard]] const char* what() const noexcept override;

  private:
    std::string errorMessage;
};
}// namespace SFL::Exceptions

#endif// SFL_COMMON_INCLUDE_EXCEPTIONS_RUNTIMEEXCEPTION_HPP_
