#include "stream_admin.hpp"
#include <algorithm>
#include <iostream>

static void createStream(StreamAdmin& admin, const std::string& name, int shard_count) {
    std::cout << "Creating stream " << name << " with " << shard_count << " shard(s)" << std::endl;
    if (!admin.createStream(name, shard_count)) {
        throw std::runtime_error("Failed to create stream " + name);
    }
}

std::string streamStatusName(StreamStatus status) {
    switch (status) {
        case StreamStatus::NOT_FOUND: return "NOT_FOUND";
        case StreamStatus::CREATING:  return "CREATING";
        case StreamStatus::ACTIVE:    return "ACTIVE";
        case StreamStatus::UPDATING:  return "UPDATING";
        case StreamStatus::DELETING:  return "DELETING";
        case StreamStatus::ERROR:     return "ERROR";
    }
    return "UNKNOWN";
}

void ensureStreamActive(StreamAdmin& admin,
                        const std::string& name,
                        int shard_count,
                        std::chrono::milliseconds poll_interval,
                        std::chrono::milliseconds timeout,
                        const ShutdownSignal& stop) {
    StreamDescription description = admin.describeStream(name);

    if (description.status == StreamStatus::DELETING) {
        throw StreamDeletingError(name);
    }

    if (description.status == StreamStatus::ACTIVE) {
        std::cout << "Stream " << name << " is ACTIVE" << std::endl;
        return;
    }

    // An ERROR answer leaves existence unknown; create on the first NOT_FOUND
    bool created = false;
    if (description.status == StreamStatus::NOT_FOUND) {
        createStream(admin, name, shard_count);
        created = true;
    }

    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            throw StreamTimeoutError("Stream " + name + " never became active");
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (stop.waitFor(std::min(poll_interval, remaining))) {
            throw StreamTimeoutError("Interrupted while waiting for stream " + name);
        }

        description = admin.describeStream(name);
        if (description.status == StreamStatus::ACTIVE) {
            std::cout << "Stream " << name << " is ACTIVE" << std::endl;
            return;
        }
        if (description.status == StreamStatus::DELETING) {
            throw StreamDeletingError(name);
        }

        if (description.status == StreamStatus::NOT_FOUND && !created) {
            createStream(admin, name, shard_count);
            created = true;
            continue;
        }

        // NOT_FOUND right after create is normal while metadata propagates
        std::cout << "Stream " << name << " is " << streamStatusName(description.status)
                  << ", waiting..." << std::endl;
    }
}
