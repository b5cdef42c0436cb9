#pragma once

#include <vector>
#include "core/image_record.hpp"

/**
 * @brief Partitions records into exact-duplicate groups and collision candidates
 *
 * A duplicate requires equality on both the content digest and the weak
 * digest. Agreement on only one of them is reported as a collision
 * candidate and never merged. Records missing either digest are reported as
 * unhashed. Output does not depend on the order of the input.
 */
class ExactDuplicateClassifier
{
public:
    static ExactDuplicateReport classify(const std::vector<ImageRecord> &records);

private:
    struct DigestPair
    {
        std::string shared;
        std::string other;
        std::string file_path;
    };

    /**
     * @brief Collision groups for one digest direction
     * @param entries Hashed records keyed by the shared digest
     */
    static std::vector<CollisionCandidateGroup> findCollisions(std::vector<DigestPair> entries, CollisionKind kind);
};
