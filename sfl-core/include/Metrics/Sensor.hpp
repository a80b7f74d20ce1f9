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

#ifndef SFL_CORE_INCLUDE_METRICS_SENSOR_HPP_
#define SFL_CORE_INCLUDE_METRICS_SENSOR_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace SFL::Metrics {

/**
 * @brief A sensor records occurrences of an event, e.g., a dropped record.
 * The metric system that consumes the recordings is provided by the host.
 */
class Sensor {
  public:
    virtual ~Sensor() = default;

    /**
     * @brief Records a single occurrence
     */
    virtual void record() = 0;
};
using SensorPtr = std::shared_ptr<Sensor>;

/**
 * @brief Sensor that counts its recordings. It can be shared between partitions.
 */
class CountingSensor : public Sensor {
  public:
    explicit CountingSensor(std::string name);

    /**
     * @brief Creates the sensor that counts dropped records of a task
     * @param threadId the thread that executes the task
     * @param taskId the task
     * @return CountingSensor
     */
    static std::shared_ptr<CountingSensor> createDroppedRecordsSensor(const std::string& threadId, const std::string& taskId);

    void record() override;

    [[nodiscard]] uint64_t getCount() const;

    [[nodiscard]] const std::string& getName() const;

  private:
    std::string name;
    std::atomic<uint64_t> count{0};
};
using CountingSensorPtr = std::shared_ptr<CountingSensor>;

}// namespace SFL::Metrics

#endif// SFL_CORE_INCLUDE_METRICS_SENSOR_HPP_
