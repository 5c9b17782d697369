#include "producer_loop.hpp"
#include <iostream>
#include <utility>

ProducerLoop::ProducerLoop(StreamProducer& producer,
                           const ShutdownSignal& stop,
                           std::chrono::milliseconds retry_backoff,
                           Clock clock)
    : producer_(producer)
    , stop_(stop)
    , retry_backoff_(retry_backoff)
    , clock_(std::move(clock)) {
}

std::string ProducerLoop::payloadFor(int64_t millis) {
    return "testData-" + std::to_string(millis);
}

std::string ProducerLoop::partitionKeyFor(int64_t millis) {
    return "partitionKey-" + std::to_string(millis);
}

bool ProducerLoop::run(uint64_t max_records) {
    while (!stop_.isTriggered()) {
        if (max_records > 0 && records_put_ >= max_records) {
            break;
        }

        int64_t now = clock_();
        std::string payload = payloadFor(now);
        std::string key = partitionKeyFor(now);

        // Same record is re-sent until it lands or fails for good
        while (true) {
            PutResult result = producer_.put(key, payload);

            if (result.status == ProduceResult::SUCCESS) {
                records_put_++;
                std::cout << "Successfully put record, partition key : " << key
                          << ", ShardID : " << result.shard_id
                          << ", SequenceNumber : " << result.sequence_number << std::endl;
                break;
            }

            if (result.status == ProduceResult::PERSISTENT_ERROR) {
                std::cerr << "Failed to put record " << key << ": " << result.error << std::endl;
                return false;
            }

            retries_++;
            std::cerr << "Retryable failure putting record " << key << ": " << result.error << std::endl;
            if (stop_.waitFor(retry_backoff_)) {
                return true;
            }
        }
    }

    std::cout << "Producer stopped after " << records_put_ << " record(s)" << std::endl;
    return true;
}
