#include "core/record_linker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <unordered_map>

RecordLinker::RecordLinker(const std::vector<ExternalRecord> &external_records, const PathKeyExtractor &extractor)
    : extractor_(extractor)
{
    for (const auto &record : external_records)
    {
        if (record.code_and_number.empty())
            continue;
        auto &ids = record_ids_by_key_[record.code_and_number];
        if (std::find(ids.begin(), ids.end(), record.record_id) == ids.end())
            ids.push_back(record.record_id);
    }

    for (auto &[key, ids] : record_ids_by_key_)
    {
        if (ids.size() < 2)
            continue;
        std::sort(ids.begin(), ids.end(), recordIdLess);
        ++ambiguous_keys_;
        Logger::warn("Key " + key + " is shared by " + std::to_string(ids.size()) +
                     " external records; images with this key stay unresolved");
    }
    Logger::info("Record linker loaded " + std::to_string(record_ids_by_key_.size()) + " record keys");
}

std::string RecordLinker::lookupRecordId(const std::string &code_and_number) const
{
    auto it = record_ids_by_key_.find(code_and_number);
    if (it == record_ids_by_key_.end() || it->second.size() != 1)
        return std::string();
    return it->second.front();
}

std::vector<std::string> RecordLinker::lookupRecordIds(const std::string &code_and_number) const
{
    auto it = record_ids_by_key_.find(code_and_number);
    return it == record_ids_by_key_.end() ? std::vector<std::string>() : it->second;
}

bool RecordLinker::recordIdLess(const std::string &a, const std::string &b)
{
    auto numeric = [](const std::string &s)
    {
        return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c)
                                         { return std::isdigit(c) != 0; });
    };
    if (numeric(a) && numeric(b) && a.size() != b.size())
        return a.size() < b.size();
    return a < b;
}

LinkageReport RecordLinker::link(const std::vector<ImageRecord> &records,
                                 const ExactDuplicateReport &exact_report,
                                 const std::vector<std::vector<SimilarityGroup>> &similarity_partitions) const
{
    LinkageReport report;

    // Groups in precedence order
    std::vector<GroupView> groups;
    for (const auto &group : exact_report.groups)
        groups.push_back({{GroupKind::EXACT_DUPLICATE, group.key()}, &group.file_paths});
    for (const auto &partition : similarity_partitions)
        for (const auto &group : partition)
            groups.push_back({{GroupKinds::fromHashKind(group.hash_kind), group.hash_value}, &group.file_paths});

    std::unordered_map<std::string, std::vector<size_t>> groups_of_path;
    for (size_t i = 0; i < groups.size(); ++i)
        for (const auto &path : *groups[i].file_paths)
            groups_of_path[path].push_back(i);

    std::vector<std::string> paths;
    paths.reserve(records.size());
    for (const auto &record : records)
        paths.push_back(record.file_path);
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    // Pass 1: direct linkage from the path key
    std::unordered_map<std::string, std::string> direct_ids;
    std::map<std::string, AmbiguousRecordKey> ambiguous_by_key;
    report.results.reserve(paths.size());
    for (const auto &path : paths)
    {
        LinkageResult result;
        result.file_path = path;
        auto path_key = extractor_.extract(path);
        if (path_key)
        {
            result.derived_key = path_key->key;
            std::vector<std::string> record_ids = lookupRecordIds(path_key->key);
            if (record_ids.size() == 1)
            {
                result.record_id = record_ids.front();
                result.status = LinkageStatus::DIRECT;
                direct_ids[path] = record_ids.front();
            }
            else if (record_ids.size() > 1)
            {
                result.status = LinkageStatus::CONFLICT;
                auto &ambiguous = ambiguous_by_key[path_key->key];
                ambiguous.code_and_number = path_key->key;
                ambiguous.record_ids = std::move(record_ids);
                ambiguous.file_paths.push_back(path);
            }
        }
        report.results.push_back(std::move(result));
    }
    for (auto &entry : ambiguous_by_key)
        report.ambiguous_keys.push_back(std::move(entry.second));

    // Pass 2: distinct direct ids per group, computed once over whole groups
    std::vector<std::set<std::string>> group_ids(groups.size());
    for (size_t i = 0; i < groups.size(); ++i)
    {
        for (const auto &path : *groups[i].file_paths)
        {
            auto it = direct_ids.find(path);
            if (it != direct_ids.end())
                group_ids[i].insert(it->second);
        }
        if (group_ids[i].size() > 1)
        {
            LinkageConflict conflict;
            conflict.group = groups[i].ref;
            conflict.record_ids.assign(group_ids[i].begin(), group_ids[i].end());
            std::sort(conflict.record_ids.begin(), conflict.record_ids.end(), recordIdLess);
            conflict.file_paths = *groups[i].file_paths;
            Logger::warn("Linkage conflict in " + GroupKinds::getKindName(groups[i].ref.kind) + " group " +
                         groups[i].ref.key + ": " + std::to_string(conflict.record_ids.size()) + " distinct records");
            report.conflicts.push_back(std::move(conflict));
        }
    }

    // Pass 3: propagation through the first deciding group
    for (auto &result : report.results)
    {
        if (result.status != LinkageStatus::UNLINKED)
            continue;
        auto it = groups_of_path.find(result.file_path);
        if (it == groups_of_path.end())
            continue;
        for (size_t group_index : it->second)
        {
            const auto &ids = group_ids[group_index];
            if (ids.empty())
                continue;
            result.via_group = groups[group_index].ref;
            if (ids.size() == 1)
            {
                result.record_id = *ids.begin();
                result.status = LinkageStatus::PROPAGATED;
            }
            else
            {
                result.status = LinkageStatus::CONFLICT;
            }
            break;
        }
    }

    for (const auto &result : report.results)
    {
        switch (result.status)
        {
        case LinkageStatus::DIRECT:
            ++report.direct_count;
            break;
        case LinkageStatus::PROPAGATED:
            ++report.propagated_count;
            break;
        case LinkageStatus::CONFLICT:
            ++report.conflict_count;
            break;
        case LinkageStatus::UNLINKED:
            ++report.unlinked_count;
            break;
        }
    }

    Logger::info("Record linkage: " + std::to_string(report.direct_count) + " direct, " +
                 std::to_string(report.propagated_count) + " propagated, " +
                 std::to_string(report.conflict_count) + " conflicted, " +
                 std::to_string(report.unlinked_count) + " unlinked, " +
                 std::to_string(report.conflicts.size()) + " conflicting groups, " +
                 std::to_string(report.ambiguous_keys.size()) + " ambiguous keys");
    return report;
}
