#include "core/report_exporter.hpp"
#include "logging/logger.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace
{
    std::string optionalToString(const std::optional<int64_t> &value)
    {
        return value ? std::to_string(*value) : "";
    }

    std::string optionalToString(const std::optional<std::string> &value)
    {
        return value.value_or("");
    }
}

std::string ReportExporter::escapeCsvField(const std::string &field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos)
        return field;
    std::string escaped = "\"";
    for (char c : field)
    {
        if (c == '"')
            escaped += "\"\"";
        else
            escaped += c;
    }
    escaped += "\"";
    return escaped;
}

bool ReportExporter::writeCsv(const std::string &path,
                              const std::vector<std::string> &header,
                              const std::vector<std::vector<std::string>> &rows)
{
    std::ofstream out(path, std::ios::binary);
    if (!out.is_open())
    {
        Logger::error("Cannot write " + path);
        return false;
    }

    auto write_row = [&out](const std::vector<std::string> &row)
    {
        for (size_t i = 0; i < row.size(); ++i)
        {
            if (i > 0)
                out << ',';
            out << escapeCsvField(row[i]);
        }
        out << '\n';
    };

    write_row(header);
    for (const auto &row : rows)
        write_row(row);

    out.flush();
    if (!out.good())
    {
        Logger::error("Write error on " + path);
        return false;
    }
    return true;
}

nlohmann::json ReportExporter::buildSummary(const AnalysisReport &report)
{
    size_t hashed = 0;
    size_t decoded = 0;
    for (const auto &record : report.records)
    {
        if (record.isHashed())
            ++hashed;
        if (record.isDecoded())
            ++decoded;
    }

    size_t removal_candidates = 0;
    size_t ambiguous_groups = 0;
    for (const auto &ranking : report.rankings)
    {
        if (ranking.ambiguous_best)
            ++ambiguous_groups;
        for (const auto &member : ranking.members)
            if (member.removal_candidate)
                ++removal_candidates;
    }

    nlohmann::json summary;
    summary["images"] = {
        {"total", report.records.size()},
        {"hashed", hashed},
        {"decoded", decoded},
        {"unhashed", report.exact.unhashed.size()}};
    summary["exact_duplicates"] = {
        {"groups", report.exact.groups.size()},
        {"weak_collision_groups", report.exact.weak_collisions.size()},
        {"strong_collision_groups", report.exact.strong_collisions.size()}};
    summary["similarity"] = {
        {"perceptual_groups", report.perceptual_groups.size()},
        {"average_groups", report.average_groups.size()}};
    summary["ranking"] = {
        {"groups", report.rankings.size()},
        {"ambiguous_groups", ambiguous_groups},
        {"removal_candidates", removal_candidates}};
    summary["linkage"] = {
        {"external_records", report.external_records.size()},
        {"skipped_record_rows", report.skipped_record_rows},
        {"direct", report.linkage.direct_count},
        {"propagated", report.linkage.propagated_count},
        {"unlinked", report.linkage.unlinked_count},
        {"conflict", report.linkage.conflict_count},
        {"conflicting_groups", report.linkage.conflicts.size()},
        {"ambiguous_keys", report.linkage.ambiguous_keys.size()}};
    return summary;
}

ExportResult ReportExporter::exportCsv(const AnalysisReport &report, const std::string &directory)
{
    ExportResult result;
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec)
    {
        result.error_message = "Cannot create output directory " + directory + ": " + ec.message();
        Logger::error(result.error_message);
        return result;
    }

    auto emit = [&](const std::string &name, const std::vector<std::string> &header,
                    const std::vector<std::vector<std::string>> &rows)
    {
        std::string path = (fs::path(directory) / name).string();
        if (!writeCsv(path, header, rows))
        {
            result.error_message = "Failed to write " + path;
            return false;
        }
        result.written_files.push_back(path);
        return true;
    };

    std::vector<std::vector<std::string>> rows;
    for (const auto &group : report.exact.groups)
        for (const auto &path : group.file_paths)
            rows.push_back({group.key(), group.content_digest, group.weak_digest, path});
    if (!emit("exact_duplicates.csv", {"group_key", "content_digest", "weak_digest", "file_path"}, rows))
        return result;

    rows.clear();
    for (const auto *collisions : {&report.exact.weak_collisions, &report.exact.strong_collisions})
        for (const auto &group : *collisions)
            for (const auto &member : group.members)
                rows.push_back({group.kind == CollisionKind::WEAK ? "weak" : "strong", group.shared_digest,
                                member.file_path, member.other_digest, member.unique_in_group ? "1" : "0"});
    if (!emit("collision_candidates.csv",
              {"collision_kind", "shared_digest", "file_path", "other_digest", "unique_in_group"}, rows))
        return result;

    rows.clear();
    for (const auto *partition : {&report.perceptual_groups, &report.average_groups})
        for (const auto &group : *partition)
            for (const auto &path : group.file_paths)
                rows.push_back({FingerprintKinds::getKindName(group.hash_kind), group.hash_value, path});
    if (!emit("similar_images.csv", {"hash_type", "hash_value", "file_path"}, rows))
        return result;

    rows.clear();
    for (const auto &ranking : report.rankings)
        for (const auto &member : ranking.members)
            rows.push_back({GroupKinds::getKindName(ranking.group.kind), ranking.group.key, member.file_path,
                            std::to_string(member.rank), optionalToString(member.x_resolution),
                            optionalToString(member.y_resolution), optionalToString(member.num_unique_colors),
                            member.removal_candidate ? "1" : "0", ranking.ambiguous_best ? "1" : "0"});
    if (!emit("ranked_members.csv",
              {"group_kind", "group_key", "file_path", "rank", "x_resolution", "y_resolution",
               "num_unique_colors", "removal_candidate", "ambiguous_best"},
              rows))
        return result;

    rows.clear();
    for (const auto &linkage : report.linkage.results)
        rows.push_back({linkage.file_path, optionalToString(linkage.record_id),
                        LinkageStatuses::getStatusName(linkage.status), optionalToString(linkage.derived_key),
                        linkage.via_group ? GroupKinds::getKindName(linkage.via_group->kind) : "",
                        linkage.via_group ? linkage.via_group->key : ""});
    if (!emit("linkage_results.csv",
              {"file_path", "record_id", "status", "derived_key", "via_group_kind", "via_group_key"}, rows))
        return result;

    rows.clear();
    for (const auto &conflict : report.linkage.conflicts)
        for (const auto &record_id : conflict.record_ids)
            rows.push_back({GroupKinds::getKindName(conflict.group.kind), conflict.group.key, record_id});
    if (!emit("linkage_conflicts.csv", {"group_kind", "group_key", "record_id"}, rows))
        return result;

    rows.clear();
    for (const auto &key : report.linkage.ambiguous_keys)
        for (const auto &record_id : key.record_ids)
            rows.push_back({key.code_and_number, record_id});
    if (!emit("ambiguous_record_keys.csv", {"code_and_number", "record_id"}, rows))
        return result;

    rows.clear();
    for (const auto &record : report.records)
        if (!record.isHashed())
            rows.push_back({record.file_path, record.error_message});
    if (!emit("unhashed_files.csv", {"file_path", "error_message"}, rows))
        return result;

    std::string summary_path = (fs::path(directory) / "summary.json").string();
    std::ofstream summary_file(summary_path);
    if (!summary_file.is_open())
    {
        result.error_message = "Failed to write " + summary_path;
        Logger::error(result.error_message);
        return result;
    }
    summary_file << buildSummary(report).dump(2) << '\n';
    result.written_files.push_back(summary_path);

    result.success = true;
    Logger::info("Exported " + std::to_string(result.written_files.size()) + " report files to " + directory);
    return result;
}
