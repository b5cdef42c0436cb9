#include "core/quality_ranker.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <tuple>

RankingKey RankingKey::fromRecord(const ImageRecord *record)
{
    RankingKey key;
    if (!record)
        return key;

    if (record->num_unique_colors)
    {
        key.has_colors = true;
        key.num_unique_colors = *record->num_unique_colors;
    }
    if (record->x_resolution && record->y_resolution)
        key.pixel_count = *record->x_resolution * *record->y_resolution;
    return key;
}

bool RankingKey::operator==(const RankingKey &other) const
{
    return std::tie(has_colors, num_unique_colors, pixel_count) ==
           std::tie(other.has_colors, other.num_unique_colors, other.pixel_count);
}

bool RankingKey::betterThan(const RankingKey &other) const
{
    return std::tie(has_colors, num_unique_colors, pixel_count) >
           std::tie(other.has_colors, other.num_unique_colors, other.pixel_count);
}

RecordIndex QualityRanker::buildIndex(const std::vector<ImageRecord> &records)
{
    RecordIndex index;
    index.reserve(records.size());
    for (const auto &record : records)
        index[record.file_path] = &record;
    return index;
}

GroupRanking QualityRanker::rankGroup(const GroupRef &group,
                                      const std::vector<std::string> &file_paths,
                                      const RecordIndex &index)
{
    GroupRanking ranking;
    ranking.group = group;
    ranking.members.reserve(file_paths.size());

    for (const auto &path : file_paths)
    {
        const ImageRecord *record = nullptr;
        auto it = index.find(path);
        if (it != index.end())
            record = it->second;
        else
            Logger::warn("Ranking " + path + " without a fingerprint record");

        RankedMember member;
        member.file_path = path;
        member.key = RankingKey::fromRecord(record);
        if (record)
        {
            member.x_resolution = record->x_resolution;
            member.y_resolution = record->y_resolution;
            member.num_unique_colors = record->num_unique_colors;
        }
        ranking.members.push_back(std::move(member));
    }

    std::sort(ranking.members.begin(), ranking.members.end(), [](const RankedMember &a, const RankedMember &b)
              {
        if (a.key.betterThan(b.key))
            return true;
        if (b.key.betterThan(a.key))
            return false;
        return a.file_path < b.file_path; });

    int rank = 0;
    int top_count = 0;
    for (size_t i = 0; i < ranking.members.size(); ++i)
    {
        auto &member = ranking.members[i];
        if (i == 0 || ranking.members[i - 1].key != member.key)
            ++rank;
        member.rank = rank;
        member.removal_candidate = rank > 1;
        if (rank == 1)
            ++top_count;
    }
    ranking.ambiguous_best = top_count > 1;

    if (ranking.ambiguous_best)
    {
        Logger::debug("Group " + GroupKinds::getKindName(group.kind) + " " + group.key + " has " +
                      std::to_string(top_count) + " members tied at rank 1");
    }
    return ranking;
}

std::vector<GroupRanking> QualityRanker::rankDuplicateGroups(const std::vector<DuplicateGroup> &groups,
                                                             const RecordIndex &index)
{
    std::vector<GroupRanking> rankings;
    rankings.reserve(groups.size());
    for (const auto &group : groups)
        rankings.push_back(rankGroup({GroupKind::EXACT_DUPLICATE, group.key()}, group.file_paths, index));
    return rankings;
}

std::vector<GroupRanking> QualityRanker::rankSimilarityGroups(const std::vector<SimilarityGroup> &groups,
                                                              const RecordIndex &index)
{
    std::vector<GroupRanking> rankings;
    rankings.reserve(groups.size());
    for (const auto &group : groups)
        rankings.push_back(rankGroup({GroupKinds::fromHashKind(group.hash_kind), group.hash_value},
                                     group.file_paths, index));
    return rankings;
}
