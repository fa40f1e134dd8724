#include "backend/CatalogStore.hpp"
#include "util/Logger.hpp"
#include "util/TimeFormat.hpp"
#include <chrono>
#include <thread>
#include <sqlite3.h>

namespace musician::backend {

namespace {
    constexpr int SCHEMA_VERSION = 1;

    // scan_name is UNIQUE so file_data can reference it directly. The
    // expression index matches the identity key used for reconciliation.
    constexpr const char* kSchemaSQL = R"SQL(
        CREATE TABLE IF NOT EXISTS scans (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            scan_name TEXT NOT NULL UNIQUE,
            start_time TEXT NOT NULL,
            end_time TEXT,
            num_files INTEGER,
            num_taggable INTEGER,
            num_errors INTEGER
        );

        CREATE TABLE IF NOT EXISTS file_data (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            file_name TEXT NOT NULL,
            full_path TEXT NOT NULL,
            extension TEXT NOT NULL,
            song_title TEXT,
            album_name TEXT,
            album_artist TEXT,
            genre TEXT,
            year INTEGER,
            duration REAL,
            taggable INTEGER NOT NULL,
            scan_name TEXT NOT NULL REFERENCES scans(scan_name),
            content_digest TEXT,
            UNIQUE (scan_name, full_path)
        );
        CREATE INDEX IF NOT EXISTS idx_file_data_extension ON file_data(extension);
        CREATE INDEX IF NOT EXISTS idx_file_data_identity
            ON file_data(scan_name, COALESCE(song_title, file_name, '') || COALESCE(album_name, ''));
    )SQL";

    constexpr const char* kFileColumns =
        "file_name, full_path, extension, song_title, album_name, album_artist, "
        "genre, year, duration, taggable, scan_name, content_digest";

    std::optional<std::time_t> optional_time(const std::optional<std::string>& text) {
        if (!text) return std::nullopt;
        return util::parse_local_time(*text);
    }
}

// StoreError

bool StoreError::is_transient() const {
    int primary = code_ & 0xff;
    return primary == SQLITE_BUSY || primary == SQLITE_LOCKED;
}

bool StoreError::is_fatal() const {
    switch (code_ & 0xff) {
        case SQLITE_IOERR:
        case SQLITE_FULL:
        case SQLITE_CANTOPEN:
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
        case SQLITE_READONLY:
        case SQLITE_PERM:
        case SQLITE_NOMEM:
            return true;
        default:
            return false;
    }
}

// Statement

Statement::Statement(const CatalogStore& store, sqlite3_stmt* stmt, std::string sql)
    : store_(&store), stmt_(stmt), sql_(std::move(sql)) {}

Statement::Statement(Statement&& other) noexcept
    : store_(other.store_), stmt_(other.stmt_), sql_(std::move(other.sql_)),
      rows_returned_(other.rows_returned_) {
    other.stmt_ = nullptr;
}

Statement& Statement::operator=(Statement&& other) noexcept {
    if (this != &other) {
        sqlite3_finalize(stmt_);
        store_ = other.store_;
        stmt_ = other.stmt_;
        sql_ = std::move(other.sql_);
        rows_returned_ = other.rows_returned_;
        other.stmt_ = nullptr;
    }
    return *this;
}

Statement::~Statement() {
    sqlite3_finalize(stmt_);
}

Statement& Statement::bind(int index, const std::string& value) {
    int rc = sqlite3_bind_text(stmt_, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) store_->raise("bind failed", rc);
    return *this;
}

Statement& Statement::bind(int index, const std::optional<std::string>& value) {
    return value ? bind(index, *value) : bind_null(index);
}

Statement& Statement::bind(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_, index, value);
    if (rc != SQLITE_OK) store_->raise("bind failed", rc);
    return *this;
}

Statement& Statement::bind(int index, const std::optional<int>& value) {
    return value ? bind(index, static_cast<int64_t>(*value)) : bind_null(index);
}

Statement& Statement::bind(int index, const std::optional<double>& value) {
    if (!value) return bind_null(index);
    int rc = sqlite3_bind_double(stmt_, index, *value);
    if (rc != SQLITE_OK) store_->raise("bind failed", rc);
    return *this;
}

Statement& Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_, index);
    if (rc != SQLITE_OK) store_->raise("bind failed", rc);
    return *this;
}

bool Statement::can_retry(int rc, int attempt, bool rows_returned, const StoreOptions& options) {
    int primary = rc & 0xff;
    if (primary != SQLITE_BUSY && primary != SQLITE_LOCKED) return false;
    return !rows_returned && attempt < options.retry_attempts;
}

bool Statement::step() {
    const auto& opts = store_->options();
    int backoff_ms = opts.retry_backoff_ms;

    for (int attempt = 0;; ++attempt) {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            rows_returned_ = true;
            return true;
        }
        if (rc == SQLITE_DONE) return false;

        if (can_retry(rc, attempt, rows_returned_, opts)) {
            util::Logger::warn("CatalogStore: Database busy, retry " + std::to_string(attempt + 1) +
                               " of " + std::to_string(opts.retry_attempts) + " in " +
                               std::to_string(backoff_ms) + "ms");
            sqlite3_reset(stmt_);
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms *= 2;
            continue;
        }

        sqlite3_reset(stmt_);
        store_->raise("step failed for [" + sql_ + "]", rc);
    }
}

void Statement::execute() {
    while (step()) {
    }
}

std::string Statement::column_text(int col) const {
    const auto* text = sqlite3_column_text(stmt_, col);
    return text ? reinterpret_cast<const char*>(text) : "";
}

std::optional<std::string> Statement::column_optional_text(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return column_text(col);
}

int64_t Statement::column_int(int col) const {
    return sqlite3_column_int64(stmt_, col);
}

std::optional<int> Statement::column_optional_int(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_int(stmt_, col);
}

std::optional<double> Statement::column_optional_double(int col) const {
    if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) return std::nullopt;
    return sqlite3_column_double(stmt_, col);
}

// CatalogStore

CatalogStore::CatalogStore(const std::filesystem::path& db_path, StoreOptions options)
    : path_(db_path), options_(options) {
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path());
    }

    int rc = sqlite3_open_v2(path_.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("Failed to open catalog " + path_.string() + ": " + msg, rc);
    }

    sqlite3_extended_result_codes(db_, 1);
    sqlite3_busy_timeout(db_, options_.busy_timeout_ms);
    exec("PRAGMA foreign_keys=ON;");

    util::Logger::info("CatalogStore: Opened " + path_.string());
}

CatalogStore::~CatalogStore() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

CatalogStore::CatalogStore(CatalogStore&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), options_(other.options_) {
    other.db_ = nullptr;
}

CatalogStore& CatalogStore::operator=(CatalogStore&& other) noexcept {
    if (this != &other) {
        if (db_) sqlite3_close_v2(db_);
        db_ = other.db_;
        path_ = std::move(other.path_);
        options_ = other.options_;
        other.db_ = nullptr;
    }
    return *this;
}

void CatalogStore::raise(const std::string& what, int code) const {
    std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(code);
    throw StoreError("CatalogStore: " + what + ": " + msg, code);
}

void CatalogStore::exec(const std::string& sql) const {
    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StoreError("CatalogStore: exec failed: " + msg, rc);
    }
}

Statement CatalogStore::prepare(const std::string& sql) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(stmt);
        raise("prepare failed for [" + sql + "]", rc);
    }
    return Statement(*this, stmt, sql);
}

void CatalogStore::init_schema() {
    util::Logger::info("CatalogStore: Initializing schema");
    exec("PRAGMA journal_mode=WAL;");
    exec(kSchemaSQL);
    exec("PRAGMA user_version=" + std::to_string(SCHEMA_VERSION) + ";");
}

bool CatalogStore::is_initialized() const {
    auto st = prepare(
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name IN ('scans', 'file_data')");
    return st.step() && st.column_int(0) == 2;
}

bool CatalogStore::scan_exists(const std::string& scan_name) const {
    auto st = prepare("SELECT 1 FROM scans WHERE scan_name = ?1");
    st.bind(1, scan_name);
    return st.step();
}

void CatalogStore::begin_scan(const model::ScanSession& session) {
    auto st = prepare("INSERT INTO scans (scan_name, start_time) VALUES (?1, ?2)");
    st.bind(1, session.scan_name);
    st.bind(2, util::format_local_time(session.start_time));
    st.execute();
    util::Logger::info("CatalogStore: Began scan session '" + session.scan_name + "'");
}

void CatalogStore::complete_scan(const std::string& scan_name, std::time_t end_time,
                                 int num_files, int num_taggable, int num_errors) {
    auto st = prepare(R"SQL(
        UPDATE scans
        SET end_time = ?1, num_files = ?2, num_taggable = ?3, num_errors = ?4
        WHERE scan_name = ?5
    )SQL");
    st.bind(1, util::format_local_time(end_time));
    st.bind(2, static_cast<int64_t>(num_files));
    st.bind(3, static_cast<int64_t>(num_taggable));
    st.bind(4, static_cast<int64_t>(num_errors));
    st.bind(5, scan_name);
    st.execute();
    util::Logger::info("CatalogStore: Completed scan session '" + scan_name + "'");
}

std::optional<model::ScanSession> CatalogStore::get_scan(const std::string& scan_name) const {
    auto st = prepare(R"SQL(
        SELECT scan_name, start_time, end_time, num_files, num_taggable, num_errors
        FROM scans WHERE scan_name = ?1
    )SQL");
    st.bind(1, scan_name);
    if (!st.step()) return std::nullopt;

    model::ScanSession session;
    session.scan_name = st.column_text(0);
    session.start_time = util::parse_local_time(st.column_text(1)).value_or(0);
    session.end_time = optional_time(st.column_optional_text(2));
    session.num_files = st.column_optional_int(3);
    session.num_taggable = st.column_optional_int(4);
    session.num_errors = st.column_optional_int(5);
    return session;
}

std::vector<model::ScanSession> CatalogStore::list_scans() const {
    auto st = prepare(R"SQL(
        SELECT scan_name, start_time, end_time, num_files, num_taggable, num_errors
        FROM scans ORDER BY id
    )SQL");

    std::vector<model::ScanSession> sessions;
    while (st.step()) {
        model::ScanSession session;
        session.scan_name = st.column_text(0);
        session.start_time = util::parse_local_time(st.column_text(1)).value_or(0);
        session.end_time = optional_time(st.column_optional_text(2));
        session.num_files = st.column_optional_int(3);
        session.num_taggable = st.column_optional_int(4);
        session.num_errors = st.column_optional_int(5);
        sessions.push_back(std::move(session));
    }
    return sessions;
}

void CatalogStore::insert_file(const model::FileRecord& r) {
    auto st = prepare(std::string("INSERT INTO file_data (") + kFileColumns +
                      ") VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12)");
    st.bind(1, r.file_name);
    st.bind(2, r.full_path);
    st.bind(3, r.extension);
    st.bind(4, r.song_title);
    st.bind(5, r.album_name);
    st.bind(6, r.album_artist);
    st.bind(7, r.genre);
    st.bind(8, r.year);
    st.bind(9, r.duration);
    st.bind(10, static_cast<int64_t>(r.taggable ? 1 : 0));
    st.bind(11, r.scan_name);
    st.bind(12, r.content_digest);
    st.execute();
}

int64_t CatalogStore::count_files(const std::optional<std::string>& scan_name) const {
    auto st = prepare("SELECT COUNT(*) FROM file_data WHERE ?1 IS NULL OR scan_name = ?1");
    st.bind(1, scan_name);
    return st.step() ? st.column_int(0) : 0;
}

std::vector<model::ExtensionCount> CatalogStore::extension_counts(const std::optional<std::string>& scan_name) const {
    auto st = prepare(R"SQL(
        SELECT extension, COUNT(*)
        FROM file_data
        WHERE ?1 IS NULL OR scan_name = ?1
        GROUP BY extension
        ORDER BY COUNT(*) DESC, extension
    )SQL");
    st.bind(1, scan_name);

    std::vector<model::ExtensionCount> counts;
    while (st.step()) {
        counts.push_back({st.column_text(0), static_cast<int>(st.column_int(1))});
    }
    return counts;
}

model::FileRecord CatalogStore::read_file_record(const Statement& st) {
    model::FileRecord r;
    r.file_name = st.column_text(0);
    r.full_path = st.column_text(1);
    r.extension = st.column_text(2);
    r.song_title = st.column_optional_text(3);
    r.album_name = st.column_optional_text(4);
    r.album_artist = st.column_optional_text(5);
    r.genre = st.column_optional_text(6);
    r.year = st.column_optional_int(7);
    r.duration = st.column_optional_double(8);
    r.taggable = st.column_int(9) != 0;
    r.scan_name = st.column_text(10);
    r.content_digest = st.column_optional_text(11);
    return r;
}

std::vector<model::FileRecord> CatalogStore::files_by_extension(const std::string& extension, int limit, int offset) const {
    auto st = prepare(std::string("SELECT ") + kFileColumns + R"SQL(
        FROM file_data
        WHERE extension = ?1
        ORDER BY file_name DESC
        LIMIT ?2 OFFSET ?3
    )SQL");
    st.bind(1, extension);
    st.bind(2, static_cast<int64_t>(limit));
    st.bind(3, static_cast<int64_t>(offset));

    std::vector<model::FileRecord> records;
    while (st.step()) {
        records.push_back(read_file_record(st));
    }
    return records;
}

}  // namespace musician::backend
