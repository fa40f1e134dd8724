#pragma once

#include "model/Catalog.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace musician::backend {

class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& msg, int code) : std::runtime_error(msg), code_(code) {}

    int code() const { return code_; }

    // Worth retrying: another connection holds a lock
    bool is_transient() const;

    // The connection or the database itself is unusable; no further
    // writes will succeed in this run
    bool is_fatal() const;

private:
    int code_;
};

struct StoreOptions {
    int busy_timeout_ms = 5000;
    int retry_attempts = 3;
    int retry_backoff_ms = 100;
};

class CatalogStore;

// RAII prepared statement. Bind indices are 1-based, column indices 0-based.
class Statement {
public:
    Statement(Statement&& other) noexcept;
    Statement& operator=(Statement&& other) noexcept;
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    ~Statement();

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, const std::optional<std::string>& value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, const std::optional<int>& value);
    Statement& bind(int index, const std::optional<double>& value);
    Statement& bind_null(int index);

    // Advances one row; true while a row is available. Transient lock
    // failures are retried with backoff before a StoreError is thrown, but
    // only until the first row has been returned.
    bool step();

    // Runs a statement that returns no rows
    void execute();

    // Retry decision for a failed sqlite3_step. Once rows have been handed
    // out a reset would replay them, so the failure is raised instead.
    static bool can_retry(int rc, int attempt, bool rows_returned, const StoreOptions& options);

    std::string column_text(int col) const;
    std::optional<std::string> column_optional_text(int col) const;
    int64_t column_int(int col) const;
    std::optional<int> column_optional_int(int col) const;
    std::optional<double> column_optional_double(int col) const;

private:
    friend class CatalogStore;
    Statement(const CatalogStore& store, sqlite3_stmt* stmt, std::string sql);

    const CatalogStore* store_;
    sqlite3_stmt* stmt_;
    std::string sql_;
    bool rows_returned_ = false;
};

/**
 * CatalogStore: the SQLite-backed record store for scan sessions and file
 * records.
 *
 * One instance owns one connection for its lifetime and is passed by
 * reference to every component that reads or writes the catalog. All
 * writes run in autocommit mode, so each call is durable on return.
 */
class CatalogStore {
public:
    explicit CatalogStore(const std::filesystem::path& db_path, StoreOptions options = {});
    ~CatalogStore();

    CatalogStore(CatalogStore&& other) noexcept;
    CatalogStore& operator=(CatalogStore&& other) noexcept;
    CatalogStore(const CatalogStore&) = delete;
    CatalogStore& operator=(const CatalogStore&) = delete;

    // Schema bootstrap, safe to run repeatedly
    void init_schema();
    [[nodiscard]] bool is_initialized() const;

    // Session bookkeeping
    [[nodiscard]] bool scan_exists(const std::string& scan_name) const;
    void begin_scan(const model::ScanSession& session);
    void complete_scan(const std::string& scan_name, std::time_t end_time,
                       int num_files, int num_taggable, int num_errors);
    std::optional<model::ScanSession> get_scan(const std::string& scan_name) const;
    std::vector<model::ScanSession> list_scans() const;

    // File records
    void insert_file(const model::FileRecord& record);
    int64_t count_files(const std::optional<std::string>& scan_name = std::nullopt) const;
    std::vector<model::ExtensionCount> extension_counts(const std::optional<std::string>& scan_name) const;
    std::vector<model::FileRecord> files_by_extension(const std::string& extension, int limit, int offset) const;

    // Ad-hoc read queries for the engines built on top of the store
    Statement prepare(const std::string& sql) const;

    const std::filesystem::path& path() const { return path_; }
    const StoreOptions& options() const { return options_; }

private:
    friend class Statement;

    void exec(const std::string& sql) const;
    [[noreturn]] void raise(const std::string& what, int code) const;
    static model::FileRecord read_file_record(const Statement& st);

    sqlite3* db_ = nullptr;
    std::filesystem::path path_;
    StoreOptions options_;
};

}  // namespace musician::backend
