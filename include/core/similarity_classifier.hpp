#pragma once

#include <vector>
#include "core/image_record.hpp"

/**
 * @brief Groups records whose image hash values are exactly equal
 *
 * No distance threshold is applied. Records without the requested hash
 * (undecodable images) are left out, and hash values that occur once do
 * not form a group.
 */
class SimilarityClassifier
{
public:
    static std::vector<SimilarityGroup> classify(const std::vector<ImageRecord> &records,
                                                 FingerprintKind kind = FingerprintKind::PERCEPTUAL_HASH);
};
