#ifndef STREAM_ADMIN_HPP
#define STREAM_ADMIN_HPP

#include "../common/shutdown_signal.hpp"
#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

enum class StreamStatus {
    NOT_FOUND,
    CREATING,
    ACTIVE,
    UPDATING,
    DELETING,
    ERROR   // describe call failed, status unknown
};

std::string streamStatusName(StreamStatus status);

struct StreamDescription {
    StreamStatus status = StreamStatus::NOT_FOUND;
    int shard_count = 0;
    std::string error;
};

// Control plane of the stream service
class StreamAdmin {
public:
    virtual ~StreamAdmin() = default;

    virtual StreamDescription describeStream(const std::string& name) = 0;

    // Returns true if the stream exists or is being created afterwards
    virtual bool createStream(const std::string& name, int shard_count) = 0;

    // Returns true if the stream is gone or being deleted afterwards
    virtual bool deleteStream(const std::string& name) = 0;

    virtual std::vector<std::string> listStreams() = 0;
};

class StreamDeletingError : public std::runtime_error {
public:
    explicit StreamDeletingError(const std::string& name)
        : std::runtime_error("Stream " + name + " is being deleted") {}
};

class StreamTimeoutError : public std::runtime_error {
public:
    explicit StreamTimeoutError(const std::string& message)
        : std::runtime_error(message) {}
};

// Create the stream if it is missing and block until it reports ACTIVE.
// Throws StreamDeletingError, StreamTimeoutError, or std::runtime_error when
// the stream cannot be created.
void ensureStreamActive(StreamAdmin& admin,
                        const std::string& name,
                        int shard_count,
                        std::chrono::milliseconds poll_interval,
                        std::chrono::milliseconds timeout,
                        const ShutdownSignal& stop);

#endif // STREAM_ADMIN_HPP
