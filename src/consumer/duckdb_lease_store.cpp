#include "duckdb_lease_store.hpp"
#include "../common/shutdown_signal.hpp"
#include <iostream>
#include <sstream>

DuckDbLeaseStore::DuckDbLeaseStore(const std::string& db_path, const std::string& table_name)
    : db_path_(db_path)
    , table_name_(table_name)
    , quoted_table_(quoteIdentifier(table_name)) {
}

DuckDbLeaseStore::~DuckDbLeaseStore() = default;

bool DuckDbLeaseStore::initialize() {
    try {
        if (db_path_.empty() || db_path_ == ":memory:") {
            db_ = std::make_unique<DuckDB>(nullptr);
        } else {
            db_ = std::make_unique<DuckDB>(db_path_);
        }
        conn_ = std::make_unique<Connection>(*db_);

        std::ostringstream create_sql;
        create_sql << "CREATE TABLE IF NOT EXISTS " << quoted_table_ << " (\n"
                   << "  shard_id VARCHAR PRIMARY KEY,\n"
                   << "  lease_owner VARCHAR,\n"
                   << "  lease_expiry_ms BIGINT NOT NULL DEFAULT 0,\n"
                   << "  checkpoint BIGINT,\n"
                   << "  lease_counter BIGINT NOT NULL DEFAULT 0,\n"
                   << "  parent_shard_ids VARCHAR NOT NULL DEFAULT ''\n"
                   << ");";

        auto result = conn_->Query(create_sql.str());
        if (result->HasError()) {
            std::cerr << "Error creating lease table " << table_name_ << ": "
                      << result->GetError() << std::endl;
            return false;
        }

        std::cout << "Lease table " << table_name_ << " ready in "
                  << (db_path_.empty() ? std::string(":memory:") : db_path_) << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize lease store: " << e.what() << std::endl;
        return false;
    }
}

std::optional<Lease> DuckDbLeaseStore::readLease(const std::string& shard_id) {
    auto leases = queryLeases("WHERE shard_id = '" + escapeSqlString(shard_id) + "'");
    if (leases.empty()) {
        return std::nullopt;
    }
    return leases.front();
}

std::vector<Lease> DuckDbLeaseStore::listLeases() {
    return queryLeases("ORDER BY shard_id");
}

std::vector<Lease> DuckDbLeaseStore::queryLeases(const std::string& where_clause) {
    std::vector<Lease> leases;
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!conn_) {
        return leases;
    }

    try {
        std::ostringstream sql;
        sql << "SELECT shard_id, lease_owner, lease_expiry_ms, checkpoint, lease_counter, parent_shard_ids "
            << "FROM " << quoted_table_ << " " << where_clause << ";";

        auto result = conn_->Query(sql.str());
        if (result->HasError()) {
            std::cerr << "Error reading lease table: " << result->GetError() << std::endl;
            return leases;
        }

        for (size_t row = 0; row < result->RowCount(); ++row) {
            Lease lease;
            lease.shard_id = result->GetValue(0, row).ToString();

            auto owner = result->GetValue(1, row);
            if (!owner.IsNull()) {
                lease.owner = owner.ToString();
            }

            lease.expiry_ms = result->GetValue(2, row).GetValue<int64_t>();

            auto checkpoint = result->GetValue(3, row);
            if (!checkpoint.IsNull()) {
                lease.checkpoint = checkpoint.GetValue<int64_t>();
            }

            lease.counter = result->GetValue(4, row).GetValue<int64_t>();
            lease.parent_ids = splitIds(result->GetValue(5, row).ToString());
            leases.push_back(std::move(lease));
        }
    } catch (const std::exception& e) {
        std::cerr << "Exception reading lease table: " << e.what() << std::endl;
    }
    return leases;
}

bool DuckDbLeaseStore::createLeaseIfAbsent(const std::string& shard_id,
                                           const std::vector<std::string>& parent_ids) {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!conn_) {
        return false;
    }

    try {
        std::ostringstream sql;
        sql << "INSERT INTO " << quoted_table_
            << " (shard_id, lease_owner, lease_expiry_ms, checkpoint, lease_counter, parent_shard_ids) "
            << "VALUES ('" << escapeSqlString(shard_id) << "', NULL, 0, NULL, 0, '"
            << escapeSqlString(joinIds(parent_ids)) << "') "
            << "ON CONFLICT DO NOTHING;";

        auto result = conn_->Query(sql.str());
        if (result->HasError()) {
            std::cerr << "Shard " << shard_id << ": Error creating lease: " << result->GetError() << std::endl;
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Shard " << shard_id << ": Exception creating lease: " << e.what() << std::endl;
        return false;
    }
}

LeaseResult DuckDbLeaseStore::acquireOrRenew(const std::string& shard_id,
                                             const std::string& worker_id,
                                             int64_t expected_counter,
                                             int64_t ttl_ms) {
    LeaseResult lease_result;
    const int64_t now = currentTimeMillis();

    std::ostringstream sql;
    sql << "UPDATE " << quoted_table_ << " SET "
        << "lease_owner = '" << escapeSqlString(worker_id) << "', "
        << "lease_expiry_ms = " << (now + ttl_ms) << ", "
        << "lease_counter = lease_counter + 1 "
        << "WHERE shard_id = '" << escapeSqlString(shard_id) << "' "
        << "AND lease_counter = " << expected_counter << " "
        << "AND (lease_owner IS NULL OR lease_owner = '" << escapeSqlString(worker_id) << "' "
        << "OR lease_expiry_ms <= " << now << ");";

    std::string error;
    int64_t changed;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        changed = executeUpdate(sql.str(), error);
    }

    if (changed < 0) {
        std::cerr << "Shard " << shard_id << ": Error updating lease: " << error << std::endl;
        lease_result.status = classifyError(error);
        return lease_result;
    }
    if (changed == 0) {
        lease_result.status = StoreStatus::CONFLICT;
        return lease_result;
    }

    lease_result.counter = expected_counter + 1;
    return lease_result;
}

StoreStatus DuckDbLeaseStore::writeCheckpoint(const std::string& shard_id,
                                              int64_t counter,
                                              SequenceNumber sequence) {
    std::lock_guard<std::mutex> lock(conn_mutex_);

    std::ostringstream sql;
    sql << "UPDATE " << quoted_table_ << " SET checkpoint = " << sequence << " "
        << "WHERE shard_id = '" << escapeSqlString(shard_id) << "' "
        << "AND lease_counter = " << counter << " "
        << "AND (checkpoint IS NULL OR checkpoint <= " << sequence << ");";

    std::string error;
    int64_t changed = executeUpdate(sql.str(), error);
    if (changed < 0) {
        std::cerr << "Shard " << shard_id << ": Error writing checkpoint: " << error << std::endl;
        return classifyError(error);
    }
    if (changed == 1) {
        return StoreStatus::OK;
    }

    // Nothing changed: either the lease moved on, or the checkpoint would regress
    try {
        std::ostringstream check_sql;
        check_sql << "SELECT lease_counter, checkpoint FROM " << quoted_table_
                  << " WHERE shard_id = '" << escapeSqlString(shard_id) << "';";
        auto result = conn_->Query(check_sql.str());
        if (result->HasError()) {
            std::cerr << "Shard " << shard_id << ": Error reading lease: " << result->GetError() << std::endl;
            return classifyError(result->GetError());
        }
        if (result->RowCount() == 0 || result->GetValue(0, 0).GetValue<int64_t>() != counter) {
            return StoreStatus::CONFLICT;
        }
        std::cout << "Shard " << shard_id << ": Ignoring checkpoint " << sequence
                  << " below stored " << result->GetValue(1, 0).ToString() << std::endl;
        return StoreStatus::OK;
    } catch (const std::exception& e) {
        std::cerr << "Shard " << shard_id << ": Exception reading lease: " << e.what() << std::endl;
        return StoreStatus::THROTTLED;
    }
}

StoreStatus DuckDbLeaseStore::releaseLease(const std::string& shard_id,
                                           const std::string& worker_id,
                                           int64_t counter) {
    // Bumping the counter fences off any write still in flight from this holder
    std::ostringstream sql;
    sql << "UPDATE " << quoted_table_ << " SET "
        << "lease_owner = NULL, lease_expiry_ms = 0, lease_counter = lease_counter + 1 "
        << "WHERE shard_id = '" << escapeSqlString(shard_id) << "' "
        << "AND lease_owner = '" << escapeSqlString(worker_id) << "' "
        << "AND lease_counter = " << counter << ";";

    std::string error;
    int64_t changed;
    {
        std::lock_guard<std::mutex> lock(conn_mutex_);
        changed = executeUpdate(sql.str(), error);
    }

    if (changed < 0) {
        std::cerr << "Shard " << shard_id << ": Error releasing lease: " << error << std::endl;
        return classifyError(error);
    }
    return changed == 1 ? StoreStatus::OK : StoreStatus::CONFLICT;
}

bool DuckDbLeaseStore::destroy() {
    std::lock_guard<std::mutex> lock(conn_mutex_);
    if (!conn_) {
        return false;
    }

    try {
        auto result = conn_->Query("DROP TABLE IF EXISTS " + quoted_table_ + ";");
        if (result->HasError()) {
            std::cerr << "Error dropping lease table " << table_name_ << ": " << result->GetError() << std::endl;
            return false;
        }
        std::cout << "Dropped lease table " << table_name_ << std::endl;
        return true;
    } catch (const std::exception& e) {
        std::cerr << "Exception dropping lease table: " << e.what() << std::endl;
        return false;
    }
}

int64_t DuckDbLeaseStore::executeUpdate(const std::string& sql, std::string& error) {
    if (!conn_) {
        error = "Catalog Error: lease store not initialized";
        return -1;
    }

    try {
        auto result = conn_->Query(sql);
        if (result->HasError()) {
            error = result->GetError();
            return -1;
        }
        // DML results carry a single "Count" row
        if (result->RowCount() == 0) {
            return 0;
        }
        return result->GetValue(0, 0).GetValue<int64_t>();
    } catch (const std::exception& e) {
        error = e.what();
        return -1;
    }
}

StoreStatus DuckDbLeaseStore::classifyError(const std::string& error) {
    if (error.find("Catalog Error") != std::string::npos ||
        error.find("Binder Error") != std::string::npos ||
        error.find("does not exist") != std::string::npos) {
        return StoreStatus::SCHEMA_ERROR;
    }
    // Write-write conflicts and I/O hiccups clear up on retry
    return StoreStatus::THROTTLED;
}

std::string DuckDbLeaseStore::escapeSqlString(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 8);
    for (char c : str) {
        if (c == '\'') {
            result += "''";  // Escape single quotes
        } else {
            result += c;
        }
    }
    return result;
}

std::string DuckDbLeaseStore::quoteIdentifier(const std::string& name) {
    std::string result = "\"";
    for (char c : name) {
        if (c == '"') {
            result += "\"\"";
        } else {
            result += c;
        }
    }
    result += "\"";
    return result;
}

std::string DuckDbLeaseStore::joinIds(const std::vector<std::string>& ids) {
    std::string joined;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) {
            joined += ",";
        }
        joined += ids[i];
    }
    return joined;
}

std::vector<std::string> DuckDbLeaseStore::splitIds(const std::string& joined) {
    std::vector<std::string> ids;
    std::string current;
    std::istringstream iss(joined);
    while (std::getline(iss, current, ',')) {
        if (!current.empty()) {
            ids.push_back(current);
        }
    }
    return ids;
}
