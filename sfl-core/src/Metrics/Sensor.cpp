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

#include <Metrics/Sensor.hpp>
#include <Util/Logger/Logger.hpp>

namespace SFL::Metrics {

CountingSensor::CountingSensor(std::string name) : name(std::move(name)) {}

std::shared_ptr<CountingSensor> CountingSensor::createDroppedRecordsSensor(const std::string& threadId, const std::string& taskId) {
    auto sensorName = threadId + "." + taskId + ".dropped-records";
    SFL_DEBUG("CountingSensor: create sensor " << sensorName);
    return std::make_shared<CountingSensor>(sensorName);
}

void CountingSensor::record() { count.fetch_add(1, std::memory_order_relaxed); }

uint64_t CountingSensor::getCount() const { return count.load(std::memory_order_relaxed); }

const std::string& CountingSensor::getName() const { return name; }

}// namespace SFL::Metrics
