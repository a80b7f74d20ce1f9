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

#ifndef SFL_CORE_INCLUDE_EXCEPTIONS_INVALIDSESSIONWINDOWEXCEPTION_HPP_
#define SFL_CORE_INCLUDE_EXCEPTIONS_INVALIDSESSIONWINDOWEXCEPTION_HPP_

#include <Common/Identifiers.hpp>
#include <Exceptions/RuntimeException.hpp>

namespace SFL::Exceptions {
/**
 * @brief Exception is raised when a session window is created with an end before its start
 */
class InvalidSessionWindowException : public RuntimeException {
  public:
    explicit InvalidSessionWindowException(Timestamp start, Timestamp end);
};
}// namespace SFL::Exceptions
#endif// SFL_CORE_INCLUDE_EXCEPTIONS_INVALIDSESSIONWINDOWEXCEPTION_HPP_
