#ifndef LEASE_STORE_HPP
#define LEASE_STORE_HPP

#include "stream_types.hpp"
#include <string>
#include <vector>
#include <optional>

// Durable per-shard lease and checkpoint table.
// Every mutation is conditional on the lease counter so that two workers
// can never both believe they own a shard.
class LeaseStore {
public:
    virtual ~LeaseStore() = default;

    virtual std::optional<Lease> readLease(const std::string& shard_id) = 0;

    virtual std::vector<Lease> listLeases() = 0;

    // Insert an unassigned row with no checkpoint; no-op if the row exists
    virtual bool createLeaseIfAbsent(const std::string& shard_id,
                                     const std::vector<std::string>& parent_ids) = 0;

    // Take or extend the lease. Fails with CONFLICT when the stored counter
    // differs from expected_counter, or when another worker holds an
    // unexpired lease.
    virtual LeaseResult acquireOrRenew(const std::string& shard_id,
                                       const std::string& worker_id,
                                       int64_t expected_counter,
                                       int64_t ttl_ms) = 0;

    // Store a checkpoint for the lease identified by counter. A sequence lower
    // than the stored one is ignored.
    virtual StoreStatus writeCheckpoint(const std::string& shard_id,
                                        int64_t counter,
                                        SequenceNumber sequence) = 0;

    // Give up ownership so another worker can take the shard without waiting
    // for expiry
    virtual StoreStatus releaseLease(const std::string& shard_id,
                                     const std::string& worker_id,
                                     int64_t counter) = 0;

    // Remove the whole table
    virtual bool destroy() = 0;
};

#endif // LEASE_STORE_HPP
