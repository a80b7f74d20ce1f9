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

#ifndef SFL_CORE_INCLUDE_COMMON_IDENTIFIERS_HPP_
#define SFL_CORE_INCLUDE_COMMON_IDENTIFIERS_HPP_

#include <cstdint>

namespace SFL {
// event time in milliseconds, negative values are valid event times
using Timestamp = int64_t;
using PartitionId = uint32_t;
using RecordOffset = int64_t;
}// namespace SFL

#endif// SFL_CORE_INCLUDE_COMMON_IDENTIFIERS_HPP_
