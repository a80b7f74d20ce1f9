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

#include <Runner/PartitionedSessionRunner.hpp>
#include <State/InMemorySessionStore.hpp>
#include <Util/Logger/Logger.hpp>
#include <exception>
#include <functional>
#include <limits>
#include <sstream>
#include <thread>

namespace SFL::Runner {

namespace {
int64_t checkedSum(const std::string& key, int64_t left, int64_t right) {
    int64_t result;
    if (__builtin_add_overflow(left, right, &result)) {
        SFL_THROW_RUNTIME_ERROR("PartitionedSessionRunner: sum of " << left << " and " << right << " for key " << key
                                                                    << " overflows int64");
    }
    return result;
}
}// namespace

void ChangePrinter::onChange(const Windowing::Windowed<std::string>& sessionKey,
                             const Windowing::Change<int64_t>& change,
                             Timestamp) {
    std::stringstream ss;
    ss << "[" << sessionKey.key() << "@" << sessionKey.window().start() << "," << sessionKey.window().end() << "] " << change;
    const std::lock_guard<std::mutex> lock(linesMutex);
    lines.emplace_back(ss.str());
}

std::vector<std::string> ChangePrinter::getLines() const {
    const std::lock_guard<std::mutex> lock(linesMutex);
    return lines;
}

PartitionedSessionRunner::PartitionedSessionRunner(Configurations::SessionWindowConfigurationPtr configuration)
    : configuration(configuration), aggregation(createSumAggregation(*configuration)),
      numberOfPartitions(validatePartitions(configuration->numberOfPartitions.getValue())) {
    if (configuration->sendOldValues.getValue()) {
        aggregation.enableSendingOldValues();
    }
    SFL_INFO("PartitionedSessionRunner: " << aggregation.windows().toString() << " on " << numberOfPartitions << " partitions");
}

uint32_t PartitionedSessionRunner::validatePartitions(uint64_t configuredPartitions) {
    if (configuredPartitions == 0) {
        SFL_THROW_RUNTIME_ERROR("PartitionedSessionRunner: the number of partitions must be at least 1");
    }
    if (configuredPartitions > std::numeric_limits<uint32_t>::max()) {
        SFL_THROW_RUNTIME_ERROR("PartitionedSessionRunner: " << configuredPartitions << " partitions exceed the maximum of "
                                                             << std::numeric_limits<uint32_t>::max());
    }
    return static_cast<uint32_t>(configuredPartitions);
}

SumAggregation PartitionedSessionRunner::createSumAggregation(const Configurations::SessionWindowConfiguration& configuration) {
    Windowing::SessionAggregationFunctions<std::string, int64_t, int64_t> sum{
        []() {
            return int64_t{0};
        },
        [](const std::string& key, const int64_t& value, const int64_t& aggregate) {
            return checkedSum(key, aggregate, value);
        },
        [](const std::string& key, const int64_t& left, const int64_t& right) {
            return checkedSum(key, left, right);
        }};
    return {Windowing::SessionWindows::create(configuration), configuration.storeName.getValue(), std::move(sum)};
}

PartitionId PartitionedSessionRunner::partitionOf(const std::optional<std::string>& key) const {
    if (!key.has_value()) {
        return 0;
    }
    return static_cast<PartitionId>(std::hash<std::string>{}(key.value()) % numberOfPartitions);
}

RunResult PartitionedSessionRunner::run(const std::vector<InputRecord>& records, const std::string& topic) {
    std::vector<std::vector<const InputRecord*>> recordsPerPartition(numberOfPartitions);
    for (const auto& record : records) {
        recordsPerPartition[partitionOf(record.key)].push_back(&record);
    }

    auto droppedRecordsSensor = Metrics::CountingSensor::createDroppedRecordsSensor("sfl-session-runner", topic);
    std::vector<std::shared_ptr<ChangePrinter>> printers;
    std::vector<std::shared_ptr<State::InMemorySessionStore<std::string, int64_t>>> stores;
    std::vector<std::exception_ptr> failures(numberOfPartitions);
    std::vector<std::thread> workers;
    for (uint32_t partition = 0; partition < numberOfPartitions; ++partition) {
        printers.emplace_back(std::make_shared<ChangePrinter>());
        stores.emplace_back(std::make_shared<State::InMemorySessionStore<std::string, int64_t>>(aggregation.storeName()));
    }

    for (uint32_t partition = 0; partition < numberOfPartitions; ++partition) {
        workers.emplace_back([&, partition]() {
            try {
                auto processor = aggregation.createProcessor(stores[partition], printers[partition], droppedRecordsSensor);
                for (const auto* record : recordsPerPartition[partition]) {
                    auto context = Windowing::RecordContext{topic, partition, record->offset, record->timestamp};
                    auto outcome = processor->process(record->key, record->value, context);
                    SFL_TRACE("PartitionedSessionRunner: partition " << partition << " offset " << record->offset << " "
                                                                     << outcome.toString());
                }
                SFL_DEBUG("PartitionedSessionRunner: partition " << partition << " finished at stream time "
                                                                 << processor->observedStreamTime());
            } catch (const std::exception& exception) {
                SFL_ERROR("PartitionedSessionRunner: partition " << partition << " failed: " << exception.what());
                failures[partition] = std::current_exception();
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }
    for (auto& failure : failures) {
        if (failure) {
            std::rethrow_exception(failure);
        }
    }

    RunResult result;
    for (uint32_t partition = 0; partition < numberOfPartitions; ++partition) {
        result.changesPerPartition.emplace_back(printers[partition]->getLines());
        result.sessionsPerPartition.emplace_back(stores[partition]->size());
    }
    result.numberOfDroppedRecords = droppedRecordsSensor->getCount();
    return result;
}

}// namespace SFL::Runner
