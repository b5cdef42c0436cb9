#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Kinds of fingerprint computed for every image
 *
 * CONTENT_DIGEST and WEAK_DIGEST are derived from the raw file bytes,
 * AVERAGE_HASH and PERCEPTUAL_HASH from the decoded pixels.
 */
enum class FingerprintKind
{
    CONTENT_DIGEST,
    WEAK_DIGEST,
    AVERAGE_HASH,
    PERCEPTUAL_HASH
};

class FingerprintKinds
{
public:
    static std::string getKindName(FingerprintKind kind)
    {
        switch (kind)
        {
        case FingerprintKind::CONTENT_DIGEST:
            return "contentDigest";
        case FingerprintKind::WEAK_DIGEST:
            return "weakDigest";
        case FingerprintKind::AVERAGE_HASH:
            return "aHash";
        case FingerprintKind::PERCEPTUAL_HASH:
            return "pHash";
        default:
            return "unknown";
        }
    }
};

/**
 * @brief Fingerprints and quality metadata of one image file
 *
 * file_path is the identity of the record and the join key to every
 * derived table. Absent optionals mean the value could not be computed.
 */
struct ImageRecord
{
    std::string file_path;
    std::optional<std::string> content_digest;
    std::optional<std::string> weak_digest;
    std::optional<std::string> average_hash;
    std::optional<std::string> perceptual_hash;
    std::optional<int64_t> x_resolution;
    std::optional<int64_t> y_resolution;
    std::optional<int64_t> num_unique_colors;
    std::optional<int64_t> file_size;
    std::string error_message; // Why hashing or decoding failed, empty when it did not

    bool isHashed() const { return content_digest.has_value() && weak_digest.has_value(); }
    bool isDecoded() const { return perceptual_hash.has_value(); }

    const std::optional<std::string> &getHash(FingerprintKind kind) const
    {
        switch (kind)
        {
        case FingerprintKind::CONTENT_DIGEST:
            return content_digest;
        case FingerprintKind::WEAK_DIGEST:
            return weak_digest;
        case FingerprintKind::AVERAGE_HASH:
            return average_hash;
        case FingerprintKind::PERCEPTUAL_HASH:
        default:
            return perceptual_hash;
        }
    }
};

/**
 * @brief Images sharing both the content digest and the weak digest
 */
struct DuplicateGroup
{
    std::string content_digest;
    std::string weak_digest;
    std::vector<std::string> file_paths; // Sorted

    // Stable key used to refer to the group from rankings and linkage
    std::string key() const { return content_digest + ":" + weak_digest; }
};

enum class CollisionKind
{
    WEAK,  // Weak digest shared, content digests differ
    STRONG // Content digest shared, weak digests differ
};

struct CollisionMember
{
    std::string file_path;
    std::string other_digest;    // The digest that does not agree
    bool unique_in_group = false; // other_digest occurs once in the group
};

/**
 * @brief Records sharing one digest while disagreeing on the other
 *
 * Surfaced for manual audit. Never merged into a DuplicateGroup.
 */
struct CollisionCandidateGroup
{
    CollisionKind kind = CollisionKind::WEAK;
    std::string shared_digest;
    std::vector<CollisionMember> members; // Sorted by file_path
};

struct ExactDuplicateReport
{
    std::vector<DuplicateGroup> groups;
    std::vector<CollisionCandidateGroup> weak_collisions;
    std::vector<CollisionCandidateGroup> strong_collisions;
    std::vector<std::string> unhashed; // Records missing either digest
};

/**
 * @brief Images sharing one image hash value exactly
 */
struct SimilarityGroup
{
    FingerprintKind hash_kind = FingerprintKind::PERCEPTUAL_HASH;
    std::string hash_value;
    std::vector<std::string> file_paths; // Sorted
};

enum class GroupKind
{
    EXACT_DUPLICATE,
    SIMILAR_PERCEPTUAL,
    SIMILAR_AVERAGE
};

class GroupKinds
{
public:
    static std::string getKindName(GroupKind kind)
    {
        switch (kind)
        {
        case GroupKind::EXACT_DUPLICATE:
            return "exact";
        case GroupKind::SIMILAR_PERCEPTUAL:
            return "similar_phash";
        case GroupKind::SIMILAR_AVERAGE:
            return "similar_ahash";
        default:
            return "unknown";
        }
    }

    static GroupKind fromHashKind(FingerprintKind kind)
    {
        return kind == FingerprintKind::AVERAGE_HASH ? GroupKind::SIMILAR_AVERAGE
                                                     : GroupKind::SIMILAR_PERCEPTUAL;
    }

    static std::optional<GroupKind> fromName(const std::string &name)
    {
        if (name == "exact")
            return GroupKind::EXACT_DUPLICATE;
        if (name == "similar_phash")
            return GroupKind::SIMILAR_PERCEPTUAL;
        if (name == "similar_ahash")
            return GroupKind::SIMILAR_AVERAGE;
        return std::nullopt;
    }
};

/**
 * @brief Reference to one group of either partition
 */
struct GroupRef
{
    GroupKind kind = GroupKind::EXACT_DUPLICATE;
    std::string key;

    bool operator==(const GroupRef &other) const { return kind == other.kind && key == other.key; }
    bool operator!=(const GroupRef &other) const { return !(*this == other); }
};

/**
 * @brief Institutional accession/inventory entry
 */
struct ExternalRecord
{
    std::string record_id;
    std::string accession;
    std::string inventory;
    std::string suffix;
    std::string code_and_number; // Join key, see RecordKeys::deriveKey
};

enum class LinkageStatus
{
    DIRECT,
    PROPAGATED,
    UNLINKED,
    CONFLICT // Group siblings disagree on the record, nothing propagated
};

class LinkageStatuses
{
public:
    static std::string getStatusName(LinkageStatus status)
    {
        switch (status)
        {
        case LinkageStatus::DIRECT:
            return "direct";
        case LinkageStatus::PROPAGATED:
            return "propagated";
        case LinkageStatus::UNLINKED:
            return "unlinked";
        case LinkageStatus::CONFLICT:
            return "conflict";
        default:
            return "unknown";
        }
    }

    static std::optional<LinkageStatus> fromName(const std::string &name)
    {
        if (name == "direct")
            return LinkageStatus::DIRECT;
        if (name == "propagated")
            return LinkageStatus::PROPAGATED;
        if (name == "unlinked")
            return LinkageStatus::UNLINKED;
        if (name == "conflict")
            return LinkageStatus::CONFLICT;
        return std::nullopt;
    }
};

struct LinkageResult
{
    std::string file_path;
    std::optional<std::string> record_id;
    LinkageStatus status = LinkageStatus::UNLINKED;
    std::optional<std::string> derived_key; // Key read from the file path, if any
    std::optional<GroupRef> via_group;      // Group that decided a propagation or conflict
};
