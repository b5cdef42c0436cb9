#include "core/similarity_classifier.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <map>
#include <stdexcept>

std::vector<SimilarityGroup> SimilarityClassifier::classify(const std::vector<ImageRecord> &records,
                                                            FingerprintKind kind)
{
    if (kind != FingerprintKind::PERCEPTUAL_HASH && kind != FingerprintKind::AVERAGE_HASH)
    {
        throw std::invalid_argument("Similarity classification requires an image hash, got " +
                                    FingerprintKinds::getKindName(kind));
    }

    std::map<std::string, std::vector<std::string>> by_hash;
    size_t skipped = 0;
    for (const auto &record : records)
    {
        const auto &hash = record.getHash(kind);
        if (!hash)
        {
            ++skipped;
            continue;
        }
        by_hash[*hash].push_back(record.file_path);
    }

    std::vector<SimilarityGroup> groups;
    for (auto &[hash, paths] : by_hash)
    {
        if (paths.size() < 2)
            continue;
        std::sort(paths.begin(), paths.end());
        SimilarityGroup group;
        group.hash_kind = kind;
        group.hash_value = hash;
        group.file_paths = std::move(paths);
        groups.push_back(std::move(group));
    }

    Logger::info("Similarity classification on " + FingerprintKinds::getKindName(kind) + ": " +
                 std::to_string(groups.size()) + " groups, " + std::to_string(skipped) +
                 " records without hash");
    return groups;
}
