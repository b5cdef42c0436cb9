#pragma once

#include "core/analysis_report.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

/**
 * @brief Result of a database operation
 */
struct DBOpResult
{
    bool success;
    std::string error_message;
    DBOpResult(bool s = true, const std::string &msg = "") : success(s), error_message(msg) {}
};

/**
 * @brief Row of the removal_candidates view
 */
struct RemovalCandidate
{
    std::string group_kind;
    std::string group_key;
    std::string file_path;
    int rank = 0;
};

/**
 * @brief SQLite store for analysis results
 *
 * Every storeReport() call replaces the contents of all derived tables
 * inside a single transaction.
 */
class DatabaseManager
{
public:
    /**
     * @brief Open (or create) the database and install the schema
     * @param db_path SQLite file path, ":memory:" for a private in-memory store
     */
    explicit DatabaseManager(const std::string &db_path);
    ~DatabaseManager();

    DatabaseManager(const DatabaseManager &) = delete;
    DatabaseManager &operator=(const DatabaseManager &) = delete;

    bool isValid() const { return db_ != nullptr; }
    const std::string &getPath() const { return db_path_; }

    /**
     * @brief Replace all derived tables with the given report
     * @return DBOpResult with success flag and error message; on failure the
     *         previous contents are kept
     */
    DBOpResult storeReport(const AnalysisReport &report);

    std::vector<ImageRecord> getImageRecords();

    std::optional<LinkageResult> getLinkageResult(const std::string &file_path);

    std::vector<RemovalCandidate> getRemovalCandidates();

    // Rank-1 members of groups whose best member is tied
    std::vector<std::string> getAmbiguousBest();

    std::vector<std::string> getConflictedImages();

    /**
     * @brief Number of rows in a schema table or view
     * @return Row count, -1 for an unknown name or a query error
     */
    long countRows(const std::string &table_name);

private:
    DBOpResult initializeSchema();
    DBOpResult execute(const std::string &sql);

    /**
     * @brief Prepare sql once and run it for count rows
     * @param bind Binds the parameters of row i
     */
    DBOpResult insertRows(const std::string &sql, size_t count,
                          const std::function<void(sqlite3_stmt *, size_t)> &bind);

    std::vector<std::string> queryStrings(const std::string &sql);

    static void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
    static void bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value);
    static void bindOptionalInt(sqlite3_stmt *stmt, int index, const std::optional<int64_t> &value);
    static std::optional<std::string> columnOptionalText(sqlite3_stmt *stmt, int index);
    static std::optional<int64_t> columnOptionalInt(sqlite3_stmt *stmt, int index);

    sqlite3 *db_;
    std::string db_path_;
    std::mutex mutex_;
};
