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

#ifndef SFL_CORE_INCLUDE_WINDOWING_RECORDCONTEXT_HPP_
#define SFL_CORE_INCLUDE_WINDOWING_RECORDCONTEXT_HPP_

#include <Common/Identifiers.hpp>
#include <string>

namespace SFL::Windowing {

/**
 * @brief Positional metadata of the record that is currently processed.
 * It is provided by the host runtime and only used for the event time and for log messages.
 */
struct RecordContext {
    std::string topic;
    PartitionId partition = 0;
    RecordOffset offset = -1;
    Timestamp timestamp = 0;
};

}// namespace SFL::Windowing

#endif// SFL_CORE_INCLUDE_WINDOWING_RECORDCONTEXT_HPP_
