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

#ifndef SFL_RUNNER_INCLUDE_RUNNER_PARTITIONEDSESSIONRUNNER_HPP_
#define SFL_RUNNER_INCLUDE_RUNNER_PARTITIONEDSESSIONRUNNER_HPP_

#include <Configurations/SessionWindowConfiguration.hpp>
#include <Metrics/Sensor.hpp>
#include <Runner/CsvRecordReader.hpp>
#include <Windowing/SessionChangeListener.hpp>
#include <Windowing/SessionWindowAggregation.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace SFL::Runner {

using SumAggregation = Windowing::SessionWindowAggregation<std::string, int64_t, int64_t>;

/**
 * @brief Renders every change of a partition as a line [key@start,end] new=<v|null> old=<v|null>.
 */
class ChangePrinter : public Windowing::SessionChangeListener<std::string, int64_t> {
  public:
    void onChange(const Windowing::Windowed<std::string>& sessionKey, const Windowing::Change<int64_t>& change, Timestamp timestamp) override;

    /**
     * @return the rendered changes in the order they were received
     */
    std::vector<std::string> getLines() const;

  private:
    mutable std::mutex linesMutex;
    std::vector<std::string> lines;
};

/**
 * @brief Result of a run over all partitions.
 */
struct RunResult {
    // rendered changes per partition
    std::vector<std::vector<std::string>> changesPerPartition;
    uint64_t numberOfDroppedRecords = 0;
    // number of sessions per partition store after the last record
    std::vector<uint64_t> sessionsPerPartition;
};

/**
 * @brief Executes a summing session window aggregation over a set of records.
 * A sum that leaves the int64 range fails the run instead of wrapping around.
 * The records are split into partitions by the hash of their key, records without a key go to partition 0.
 * Every partition is processed by its own thread with its own processor and store,
 * the records of a partition are processed in input order.
 */
class PartitionedSessionRunner {
  public:
    explicit PartitionedSessionRunner(Configurations::SessionWindowConfigurationPtr configuration);

    /**
     * @brief Processes all records and waits until every partition finished
     * @param records the input records
     * @param topic the name of the input
     * @return RunResult
     * @throws the first exception that was raised by a partition
     */
    RunResult run(const std::vector<InputRecord>& records, const std::string& topic);

    /**
     * @brief Computes the partition of a record key
     */
    [[nodiscard]] PartitionId partitionOf(const std::optional<std::string>& key) const;

    [[nodiscard]] const SumAggregation& getAggregation() const { return aggregation; }

  private:
    static SumAggregation createSumAggregation(const Configurations::SessionWindowConfiguration& configuration);

    /**
     * @brief Checks that the configured number of partitions lies in [1, UINT32_MAX]
     * @throws RuntimeException otherwise
     */
    static uint32_t validatePartitions(uint64_t configuredPartitions);

    Configurations::SessionWindowConfigurationPtr configuration;
    SumAggregation aggregation;
    uint32_t numberOfPartitions;
};

}// namespace SFL::Runner

#endif// SFL_RUNNER_INCLUDE_RUNNER_PARTITIONEDSESSIONRUNNER_HPP_
