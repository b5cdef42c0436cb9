#include "database/database_manager.hpp"
#include "database/sql_scripts.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iterator>

DatabaseManager::DatabaseManager(const std::string &db_path)
    : db_(nullptr), db_path_(db_path)
{
    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to open database: " + std::string(db_ ? sqlite3_errmsg(db_) : "out of memory"));
        sqlite3_close(db_);
        db_ = nullptr;
        return;
    }
    Logger::info("Database opened successfully: " + db_path);

    rc = sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
        Logger::warn("Failed to enable WAL mode: " + std::string(sqlite3_errmsg(db_)));
    rc = sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK)
        Logger::warn("Failed to set synchronous mode: " + std::string(sqlite3_errmsg(db_)));

    DBOpResult schema = initializeSchema();
    if (!schema.success)
    {
        Logger::error("Failed to initialize schema: " + schema.error_message);
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

DatabaseManager::~DatabaseManager()
{
    if (db_)
    {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

DBOpResult DatabaseManager::execute(const std::string &sql)
{
    char *err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK)
    {
        std::string error = err_msg ? err_msg : sqlite3_errmsg(db_);
        sqlite3_free(err_msg);
        return DBOpResult(false, error);
    }
    return DBOpResult(true, "");
}

DBOpResult DatabaseManager::initializeSchema()
{
    for (const char *script : {DatabaseScripts::CREATE_TABLES, DatabaseScripts::CREATE_INDEXES, DatabaseScripts::CREATE_VIEWS})
    {
        DBOpResult result = execute(script);
        if (!result.success)
            return result;
    }
    return DBOpResult(true, "");
}

void DatabaseManager::bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void DatabaseManager::bindOptionalText(sqlite3_stmt *stmt, int index, const std::optional<std::string> &value)
{
    if (value)
        sqlite3_bind_text(stmt, index, value->c_str(), -1, SQLITE_TRANSIENT);
    else
        sqlite3_bind_null(stmt, index);
}

void DatabaseManager::bindOptionalInt(sqlite3_stmt *stmt, int index, const std::optional<int64_t> &value)
{
    if (value)
        sqlite3_bind_int64(stmt, index, static_cast<sqlite3_int64>(*value));
    else
        sqlite3_bind_null(stmt, index);
}

std::optional<std::string> DatabaseManager::columnOptionalText(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
        return std::nullopt;
    return std::string(reinterpret_cast<const char *>(sqlite3_column_text(stmt, index)));
}

std::optional<int64_t> DatabaseManager::columnOptionalInt(sqlite3_stmt *stmt, int index)
{
    if (sqlite3_column_type(stmt, index) == SQLITE_NULL)
        return std::nullopt;
    return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
}

DBOpResult DatabaseManager::insertRows(const std::string &sql, size_t count,
                                       const std::function<void(sqlite3_stmt *, size_t)> &bind)
{
    if (count == 0)
        return DBOpResult(true, "");

    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
        return DBOpResult(false, "Failed to prepare statement: " + std::string(sqlite3_errmsg(db_)));

    for (size_t i = 0; i < count; ++i)
    {
        sqlite3_reset(stmt);
        sqlite3_clear_bindings(stmt);
        bind(stmt, i);
        rc = sqlite3_step(stmt);
        if (rc != SQLITE_DONE)
        {
            std::string error = "Failed to insert row: " + std::string(sqlite3_errmsg(db_));
            sqlite3_finalize(stmt);
            return DBOpResult(false, error);
        }
    }
    sqlite3_finalize(stmt);
    return DBOpResult(true, "");
}

DBOpResult DatabaseManager::storeReport(const AnalysisReport &report)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
    {
        Logger::error("Database not initialized");
        return DBOpResult(false, "Database not initialized");
    }

    DBOpResult result = execute("BEGIN IMMEDIATE TRANSACTION;");
    if (!result.success)
    {
        Logger::error("Failed to begin transaction: " + result.error_message);
        return result;
    }

    auto fail = [this](const DBOpResult &failure)
    {
        Logger::error("Storing analysis report failed: " + failure.error_message);
        DBOpResult rollback = execute("ROLLBACK;");
        if (!rollback.success)
            Logger::error("Rollback failed: " + rollback.error_message);
        return failure;
    };

    for (const char *table : DatabaseScripts::DERIVED_TABLES)
    {
        result = execute(std::string("DELETE FROM ") + table + ";");
        if (!result.success)
            return fail(result);
    }

    const auto &records = report.records;
    result = insertRows(R"(
            INSERT INTO image_records
            (file_path, content_digest, weak_digest, average_hash, perceptual_hash,
             x_resolution, y_resolution, num_unique_colors, file_size, error_message)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)
        )",
                        records.size(), [&records](sqlite3_stmt *stmt, size_t i)
                        {
        const ImageRecord &r = records[i];
        bindText(stmt, 1, r.file_path);
        bindOptionalText(stmt, 2, r.content_digest);
        bindOptionalText(stmt, 3, r.weak_digest);
        bindOptionalText(stmt, 4, r.average_hash);
        bindOptionalText(stmt, 5, r.perceptual_hash);
        bindOptionalInt(stmt, 6, r.x_resolution);
        bindOptionalInt(stmt, 7, r.y_resolution);
        bindOptionalInt(stmt, 8, r.num_unique_colors);
        bindOptionalInt(stmt, 9, r.file_size);
        bindOptionalText(stmt, 10, r.error_message.empty() ? std::nullopt : std::optional<std::string>(r.error_message)); });
    if (!result.success)
        return fail(result);

    const auto &external = report.external_records;
    result = insertRows(R"(
            INSERT INTO external_records (record_id, accession, inventory, suffix, code_and_number)
            VALUES (?, ?, ?, ?, ?)
        )",
                        external.size(), [&external](sqlite3_stmt *stmt, size_t i)
                        {
        bindText(stmt, 1, external[i].record_id);
        bindText(stmt, 2, external[i].accession);
        bindText(stmt, 3, external[i].inventory);
        bindText(stmt, 4, external[i].suffix);
        bindText(stmt, 5, external[i].code_and_number); });
    if (!result.success)
        return fail(result);

    // Flatten group memberships into rows
    struct DuplicateRow
    {
        const DuplicateGroup *group;
        const std::string *file_path;
    };
    std::vector<DuplicateRow> duplicate_rows;
    for (const auto &group : report.exact.groups)
        for (const auto &path : group.file_paths)
            duplicate_rows.push_back({&group, &path});
    result = insertRows(R"(
            INSERT INTO exact_duplicates (group_key, content_digest, weak_digest, file_path)
            VALUES (?, ?, ?, ?)
        )",
                        duplicate_rows.size(), [&duplicate_rows](sqlite3_stmt *stmt, size_t i)
                        {
        const DuplicateGroup &group = *duplicate_rows[i].group;
        bindText(stmt, 1, group.key());
        bindText(stmt, 2, group.content_digest);
        bindText(stmt, 3, group.weak_digest);
        bindText(stmt, 4, *duplicate_rows[i].file_path); });
    if (!result.success)
        return fail(result);

    struct CollisionRow
    {
        const CollisionCandidateGroup *group;
        const CollisionMember *member;
    };
    std::vector<CollisionRow> collision_rows;
    for (const auto *collisions : {&report.exact.weak_collisions, &report.exact.strong_collisions})
        for (const auto &group : *collisions)
            for (const auto &member : group.members)
                collision_rows.push_back({&group, &member});
    result = insertRows(R"(
            INSERT INTO collision_candidates
            (collision_kind, shared_digest, file_path, other_digest, unique_in_group)
            VALUES (?, ?, ?, ?, ?)
        )",
                        collision_rows.size(), [&collision_rows](sqlite3_stmt *stmt, size_t i)
                        {
        const CollisionCandidateGroup &group = *collision_rows[i].group;
        const CollisionMember &member = *collision_rows[i].member;
        bindText(stmt, 1, group.kind == CollisionKind::WEAK ? "weak" : "strong");
        bindText(stmt, 2, group.shared_digest);
        bindText(stmt, 3, member.file_path);
        bindText(stmt, 4, member.other_digest);
        sqlite3_bind_int(stmt, 5, member.unique_in_group ? 1 : 0); });
    if (!result.success)
        return fail(result);

    struct SimilarRow
    {
        const SimilarityGroup *group;
        const std::string *file_path;
    };
    std::vector<SimilarRow> similar_rows;
    for (const auto *partition : {&report.perceptual_groups, &report.average_groups})
        for (const auto &group : *partition)
            for (const auto &path : group.file_paths)
                similar_rows.push_back({&group, &path});
    result = insertRows(R"(
            INSERT INTO similar_images (hash_type, hash_value, file_path) VALUES (?, ?, ?)
        )",
                        similar_rows.size(), [&similar_rows](sqlite3_stmt *stmt, size_t i)
                        {
        const SimilarityGroup &group = *similar_rows[i].group;
        bindText(stmt, 1, FingerprintKinds::getKindName(group.hash_kind));
        bindText(stmt, 2, group.hash_value);
        bindText(stmt, 3, *similar_rows[i].file_path); });
    if (!result.success)
        return fail(result);

    struct RankedRow
    {
        const GroupRanking *ranking;
        const RankedMember *member;
    };
    std::vector<RankedRow> ranked_rows;
    for (const auto &ranking : report.rankings)
        for (const auto &member : ranking.members)
            ranked_rows.push_back({&ranking, &member});
    result = insertRows(R"(
            INSERT INTO ranked_members
            (group_kind, group_key, file_path, rank, x_resolution, y_resolution,
             num_unique_colors, removal_candidate, ambiguous_best)
            VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)
        )",
                        ranked_rows.size(), [&ranked_rows](sqlite3_stmt *stmt, size_t i)
                        {
        const GroupRanking &ranking = *ranked_rows[i].ranking;
        const RankedMember &member = *ranked_rows[i].member;
        bindText(stmt, 1, GroupKinds::getKindName(ranking.group.kind));
        bindText(stmt, 2, ranking.group.key);
        bindText(stmt, 3, member.file_path);
        sqlite3_bind_int(stmt, 4, member.rank);
        bindOptionalInt(stmt, 5, member.x_resolution);
        bindOptionalInt(stmt, 6, member.y_resolution);
        bindOptionalInt(stmt, 7, member.num_unique_colors);
        sqlite3_bind_int(stmt, 8, member.removal_candidate ? 1 : 0);
        sqlite3_bind_int(stmt, 9, ranking.ambiguous_best ? 1 : 0); });
    if (!result.success)
        return fail(result);

    const auto &linkage = report.linkage.results;
    result = insertRows(R"(
            INSERT INTO linkage_results
            (file_path, record_id, status, derived_key, via_group_kind, via_group_key)
            VALUES (?, ?, ?, ?, ?, ?)
        )",
                        linkage.size(), [&linkage](sqlite3_stmt *stmt, size_t i)
                        {
        const LinkageResult &r = linkage[i];
        bindText(stmt, 1, r.file_path);
        bindOptionalText(stmt, 2, r.record_id);
        bindText(stmt, 3, LinkageStatuses::getStatusName(r.status));
        bindOptionalText(stmt, 4, r.derived_key);
        if (r.via_group)
        {
            bindText(stmt, 5, GroupKinds::getKindName(r.via_group->kind));
            bindText(stmt, 6, r.via_group->key);
        }
        else
        {
            sqlite3_bind_null(stmt, 5);
            sqlite3_bind_null(stmt, 6);
        } });
    if (!result.success)
        return fail(result);

    struct ConflictRow
    {
        const LinkageConflict *conflict;
        const std::string *record_id;
    };
    std::vector<ConflictRow> conflict_rows;
    for (const auto &conflict : report.linkage.conflicts)
        for (const auto &record_id : conflict.record_ids)
            conflict_rows.push_back({&conflict, &record_id});
    result = insertRows(R"(
            INSERT INTO linkage_conflicts (group_kind, group_key, record_id) VALUES (?, ?, ?)
        )",
                        conflict_rows.size(), [&conflict_rows](sqlite3_stmt *stmt, size_t i)
                        {
        const LinkageConflict &conflict = *conflict_rows[i].conflict;
        bindText(stmt, 1, GroupKinds::getKindName(conflict.group.kind));
        bindText(stmt, 2, conflict.group.key);
        bindText(stmt, 3, *conflict_rows[i].record_id); });
    if (!result.success)
        return fail(result);

    struct AmbiguousKeyRow
    {
        const AmbiguousRecordKey *key;
        const std::string *record_id;
    };
    std::vector<AmbiguousKeyRow> ambiguous_rows;
    for (const auto &key : report.linkage.ambiguous_keys)
        for (const auto &record_id : key.record_ids)
            ambiguous_rows.push_back({&key, &record_id});
    result = insertRows(R"(
            INSERT INTO ambiguous_record_keys (code_and_number, record_id) VALUES (?, ?)
        )",
                        ambiguous_rows.size(), [&ambiguous_rows](sqlite3_stmt *stmt, size_t i)
                        {
        bindText(stmt, 1, ambiguous_rows[i].key->code_and_number);
        bindText(stmt, 2, *ambiguous_rows[i].record_id); });
    if (!result.success)
        return fail(result);

    // Unhashed paths with the reason recorded on the image record
    std::vector<std::pair<std::string, std::string>> unhashed;
    for (const auto &path : report.exact.unhashed)
    {
        auto it = std::lower_bound(records.begin(), records.end(), path,
                                   [](const ImageRecord &r, const std::string &p)
                                   { return r.file_path < p; });
        std::string reason = (it != records.end() && it->file_path == path) ? it->error_message : "";
        unhashed.emplace_back(path, reason);
    }
    result = insertRows(R"(
            INSERT INTO unhashed_files (file_path, error_message) VALUES (?, ?)
        )",
                        unhashed.size(), [&unhashed](sqlite3_stmt *stmt, size_t i)
                        {
        bindText(stmt, 1, unhashed[i].first);
        bindText(stmt, 2, unhashed[i].second); });
    if (!result.success)
        return fail(result);

    result = execute("COMMIT;");
    if (!result.success)
        return fail(result);

    Logger::info("Stored analysis report in " + db_path_ + ": " + std::to_string(records.size()) + " images, " +
                 std::to_string(duplicate_rows.size()) + " duplicate rows, " +
                 std::to_string(ranked_rows.size()) + " ranked rows");
    return DBOpResult(true, "");
}

std::vector<ImageRecord> DatabaseManager::getImageRecords()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ImageRecord> records;
    if (!db_)
        return records;

    const std::string select_sql = R"(
            SELECT file_path, content_digest, weak_digest, average_hash, perceptual_hash,
                   x_resolution, y_resolution, num_unique_colors, file_size, error_message
            FROM image_records
            ORDER BY file_path
        )";

    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return records;
    }

    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        ImageRecord record;
        record.file_path = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        record.content_digest = columnOptionalText(stmt, 1);
        record.weak_digest = columnOptionalText(stmt, 2);
        record.average_hash = columnOptionalText(stmt, 3);
        record.perceptual_hash = columnOptionalText(stmt, 4);
        record.x_resolution = columnOptionalInt(stmt, 5);
        record.y_resolution = columnOptionalInt(stmt, 6);
        record.num_unique_colors = columnOptionalInt(stmt, 7);
        record.file_size = columnOptionalInt(stmt, 8);
        record.error_message = columnOptionalText(stmt, 9).value_or("");
        records.push_back(std::move(record));
    }
    sqlite3_finalize(stmt);
    return records;
}

std::optional<LinkageResult> DatabaseManager::getLinkageResult(const std::string &file_path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return std::nullopt;

    const std::string select_sql = R"(
            SELECT record_id, status, derived_key, via_group_kind, via_group_key
            FROM linkage_results
            WHERE file_path = ?
        )";

    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return std::nullopt;
    }
    bindText(stmt, 1, file_path);

    std::optional<LinkageResult> result;
    if (sqlite3_step(stmt) == SQLITE_ROW)
    {
        LinkageResult row;
        row.file_path = file_path;
        row.record_id = columnOptionalText(stmt, 0);
        std::string status_name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        auto status = LinkageStatuses::fromName(status_name);
        if (!status)
            Logger::warn("Unknown linkage status in database: " + status_name);
        row.status = status.value_or(LinkageStatus::UNLINKED);
        row.derived_key = columnOptionalText(stmt, 2);
        auto kind_name = columnOptionalText(stmt, 3);
        auto key = columnOptionalText(stmt, 4);
        if (kind_name && key)
        {
            auto kind = GroupKinds::fromName(*kind_name);
            if (kind)
                row.via_group = GroupRef{*kind, *key};
        }
        result = std::move(row);
    }
    sqlite3_finalize(stmt);
    return result;
}

std::vector<RemovalCandidate> DatabaseManager::getRemovalCandidates()
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RemovalCandidate> candidates;
    if (!db_)
        return candidates;

    const std::string select_sql =
        "SELECT group_kind, group_key, file_path, rank FROM removal_candidates "
        "ORDER BY group_kind, group_key, rank, file_path";

    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(db_, select_sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return candidates;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW)
    {
        RemovalCandidate candidate;
        candidate.group_kind = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0));
        candidate.group_key = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        candidate.file_path = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 2));
        candidate.rank = sqlite3_column_int(stmt, 3);
        candidates.push_back(std::move(candidate));
    }
    sqlite3_finalize(stmt);
    return candidates;
}

std::vector<std::string> DatabaseManager::queryStrings(const std::string &sql)
{
    std::vector<std::string> values;
    if (!db_)
        return values;

    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to prepare select statement: " + std::string(sqlite3_errmsg(db_)));
        return values;
    }
    while (sqlite3_step(stmt) == SQLITE_ROW)
        values.emplace_back(reinterpret_cast<const char *>(sqlite3_column_text(stmt, 0)));
    sqlite3_finalize(stmt);
    return values;
}

std::vector<std::string> DatabaseManager::getAmbiguousBest()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queryStrings("SELECT DISTINCT file_path FROM ambiguous_best ORDER BY file_path");
}

std::vector<std::string> DatabaseManager::getConflictedImages()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queryStrings("SELECT DISTINCT file_path FROM conflicted_images ORDER BY file_path");
}

long DatabaseManager::countRows(const std::string &table_name)
{
    static const std::vector<std::string> views = {
        "exact_duplicates_linked", "removal_candidates", "ambiguous_best", "conflicted_images"};

    bool known = std::find(views.begin(), views.end(), table_name) != views.end() ||
                 std::any_of(std::begin(DatabaseScripts::DERIVED_TABLES), std::end(DatabaseScripts::DERIVED_TABLES),
                             [&table_name](const char *table)
                             { return table_name == table; });
    if (!known)
    {
        Logger::warn("countRows called with unknown table: " + table_name);
        return -1;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!db_)
        return -1;

    std::string sql = "SELECT COUNT(*) FROM " + table_name;
    sqlite3_stmt *stmt;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK)
    {
        Logger::error("Failed to prepare count statement: " + std::string(sqlite3_errmsg(db_)));
        return -1;
    }
    long count = -1;
    if (sqlite3_step(stmt) == SQLITE_ROW)
        count = static_cast<long>(sqlite3_column_int64(stmt, 0));
    sqlite3_finalize(stmt);
    return count;
}
