#ifndef DUCKDB_LEASE_STORE_HPP
#define DUCKDB_LEASE_STORE_HPP

#include "../common/lease_store.hpp"
#include "duckdb.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using duckdb::DuckDB;
using duckdb::Connection;

// Lease table kept in DuckDB, one row per shard.
// Ownership changes are UPDATEs conditional on lease_counter; the number of
// changed rows tells whether the caller won.
class DuckDbLeaseStore : public LeaseStore {
public:
    // db_path ":memory:" keeps the table in memory
    DuckDbLeaseStore(const std::string& db_path, const std::string& table_name);
    ~DuckDbLeaseStore() override;

    // Open the database and create the lease table if it doesn't exist
    bool initialize();

    std::optional<Lease> readLease(const std::string& shard_id) override;
    std::vector<Lease> listLeases() override;
    bool createLeaseIfAbsent(const std::string& shard_id,
                             const std::vector<std::string>& parent_ids) override;
    LeaseResult acquireOrRenew(const std::string& shard_id,
                               const std::string& worker_id,
                               int64_t expected_counter,
                               int64_t ttl_ms) override;
    StoreStatus writeCheckpoint(const std::string& shard_id,
                                int64_t counter,
                                SequenceNumber sequence) override;
    StoreStatus releaseLease(const std::string& shard_id,
                             const std::string& worker_id,
                             int64_t counter) override;
    bool destroy() override;

    const std::string& getTableName() const { return table_name_; }

    // SQL string escaping
    static std::string escapeSqlString(const std::string& str);

    // Double-quote an identifier
    static std::string quoteIdentifier(const std::string& name);

    // Map a DuckDB error message to a store status
    static StoreStatus classifyError(const std::string& error);

    // parent_shard_ids column holds a comma-separated list
    static std::string joinIds(const std::vector<std::string>& ids);
    static std::vector<std::string> splitIds(const std::string& joined);

private:
    std::string db_path_;
    std::string table_name_;
    std::string quoted_table_;

    std::unique_ptr<DuckDB> db_;
    std::unique_ptr<Connection> conn_;
    std::mutex conn_mutex_;  // one statement at a time on the shared connection

    // Run an UPDATE and return the number of changed rows, or -1 on error
    int64_t executeUpdate(const std::string& sql, std::string& error);

    std::vector<Lease> queryLeases(const std::string& where_clause);
};

#endif // DUCKDB_LEASE_STORE_HPP
