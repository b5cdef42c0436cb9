#include "core/exact_duplicate_classifier.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <map>
#include <tuple>
#include <utility>

ExactDuplicateReport ExactDuplicateClassifier::classify(const std::vector<ImageRecord> &records)
{
    ExactDuplicateReport report;

    std::map<std::pair<std::string, std::string>, std::vector<std::string>> by_pair; // (weak, content) -> paths
    std::vector<DigestPair> by_weak;
    std::vector<DigestPair> by_content;
    by_weak.reserve(records.size());
    by_content.reserve(records.size());

    for (const auto &record : records)
    {
        if (!record.isHashed())
        {
            report.unhashed.push_back(record.file_path);
            continue;
        }
        const std::string &weak = *record.weak_digest;
        const std::string &content = *record.content_digest;
        by_pair[{weak, content}].push_back(record.file_path);
        by_weak.push_back({weak, content, record.file_path});
        by_content.push_back({content, weak, record.file_path});
    }
    std::sort(report.unhashed.begin(), report.unhashed.end());

    for (auto &[digests, paths] : by_pair)
    {
        if (paths.size() < 2)
            continue;
        std::sort(paths.begin(), paths.end());
        DuplicateGroup group;
        group.weak_digest = digests.first;
        group.content_digest = digests.second;
        group.file_paths = paths;
        report.groups.push_back(std::move(group));
    }

    report.weak_collisions = findCollisions(std::move(by_weak), CollisionKind::WEAK);
    report.strong_collisions = findCollisions(std::move(by_content), CollisionKind::STRONG);

    Logger::info("Exact duplicate classification: " + std::to_string(report.groups.size()) +
                 " groups, " + std::to_string(report.weak_collisions.size()) + " weak collision groups, " +
                 std::to_string(report.strong_collisions.size()) + " strong collision groups, " +
                 std::to_string(report.unhashed.size()) + " unhashed files");
    return report;
}

std::vector<CollisionCandidateGroup> ExactDuplicateClassifier::findCollisions(std::vector<DigestPair> entries,
                                                                              CollisionKind kind)
{
    std::sort(entries.begin(), entries.end(), [](const DigestPair &a, const DigestPair &b)
              { return std::tie(a.shared, a.file_path) < std::tie(b.shared, b.file_path); });

    std::vector<CollisionCandidateGroup> result;
    size_t begin = 0;
    while (begin < entries.size())
    {
        size_t end = begin;
        while (end < entries.size() && entries[end].shared == entries[begin].shared)
            ++end;

        if (end - begin >= 2)
        {
            std::map<std::string, size_t> other_counts;
            for (size_t i = begin; i < end; ++i)
                other_counts[entries[i].other]++;

            if (other_counts.size() > 1)
            {
                CollisionCandidateGroup group;
                group.kind = kind;
                group.shared_digest = entries[begin].shared;
                for (size_t i = begin; i < end; ++i)
                {
                    CollisionMember member;
                    member.file_path = entries[i].file_path;
                    member.other_digest = entries[i].other;
                    member.unique_in_group = other_counts[entries[i].other] == 1;
                    group.members.push_back(std::move(member));
                }
                Logger::debug(std::string(kind == CollisionKind::WEAK ? "Weak" : "Strong") +
                              " digest collision on " + group.shared_digest + " across " +
                              std::to_string(group.members.size()) + " files");
                result.push_back(std::move(group));
            }
        }
        begin = end;
    }
    return result;
}
