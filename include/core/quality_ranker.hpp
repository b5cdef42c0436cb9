#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/image_record.hpp"

using RecordIndex = std::unordered_map<std::string, const ImageRecord *>;

/**
 * @brief Ordering key of one group member, compared descending
 */
struct RankingKey
{
    bool has_colors = false;
    int64_t num_unique_colors = 0;
    int64_t pixel_count = 0; // x * y, 0 when the resolution is missing

    static RankingKey fromRecord(const ImageRecord *record);

    bool operator==(const RankingKey &other) const;
    bool operator!=(const RankingKey &other) const { return !(*this == other); }
    // True when this key ranks strictly better than other
    bool betterThan(const RankingKey &other) const;
};

struct RankedMember
{
    std::string file_path;
    int rank = 0;
    RankingKey key;
    std::optional<int64_t> x_resolution;
    std::optional<int64_t> y_resolution;
    std::optional<int64_t> num_unique_colors;
    bool removal_candidate = false;
};

struct GroupRanking
{
    GroupRef group;
    std::vector<RankedMember> members; // Ordered by rank, then file_path
    bool ambiguous_best = false;       // More than one member holds rank 1
};

/**
 * @brief Dense ranking of group members by quality
 *
 * Priority: presence of a color count, color count, pixel count. Members
 * with equal keys share a rank and the next distinct key gets rank + 1.
 * A tie on rank 1 is exposed through GroupRanking::ambiguous_best and is
 * never broken arbitrarily.
 */
class QualityRanker
{
public:
    static RecordIndex buildIndex(const std::vector<ImageRecord> &records);

    static GroupRanking rankGroup(const GroupRef &group,
                                  const std::vector<std::string> &file_paths,
                                  const RecordIndex &index);

    static std::vector<GroupRanking> rankDuplicateGroups(const std::vector<DuplicateGroup> &groups,
                                                         const RecordIndex &index);

    static std::vector<GroupRanking> rankSimilarityGroups(const std::vector<SimilarityGroup> &groups,
                                                          const RecordIndex &index);
};
