#ifndef PRODUCER_LOOP_HPP
#define PRODUCER_LOOP_HPP

#include "stream_producer.hpp"
#include "../common/shutdown_signal.hpp"
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

// Writes sample records ("testData-<millis>") until stopped
class ProducerLoop {
public:
    using Clock = std::function<int64_t()>;

    ProducerLoop(StreamProducer& producer,
                 const ShutdownSignal& stop,
                 std::chrono::milliseconds retry_backoff,
                 Clock clock = currentTimeMillis);

    // Returns false if a persistent failure ended the loop.
    // max_records == 0 means no limit.
    bool run(uint64_t max_records = 0);

    uint64_t getRecordsPut() const { return records_put_; }
    uint64_t getRetries() const { return retries_; }

    static std::string payloadFor(int64_t millis);
    static std::string partitionKeyFor(int64_t millis);

private:
    StreamProducer& producer_;
    const ShutdownSignal& stop_;
    std::chrono::milliseconds retry_backoff_;
    Clock clock_;

    uint64_t records_put_ = 0;
    uint64_t retries_ = 0;
};

#endif // PRODUCER_LOOP_HPP
