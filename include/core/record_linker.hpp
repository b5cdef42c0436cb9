#pragma once

#include <map>
#include <string>
#include <vector>
#include "core/image_record.hpp"
#include "core/record_keys.hpp"

/**
 * @brief A group whose members link directly to different external records
 */
struct LinkageConflict
{
    GroupRef group;
    std::vector<std::string> record_ids; // Distinct, sorted
    std::vector<std::string> file_paths; // All group members
};

/**
 * @brief A path key carried by more than one external record
 *
 * Images deriving such a key are not linked to any of the records.
 */
struct AmbiguousRecordKey
{
    std::string code_and_number;
    std::vector<std::string> record_ids; // Distinct, sorted
    std::vector<std::string> file_paths; // Images deriving the key, sorted
};

struct LinkageReport
{
    std::vector<LinkageResult> results; // One per image, sorted by file_path
    std::vector<LinkageConflict> conflicts;
    std::vector<AmbiguousRecordKey> ambiguous_keys; // Only keys some image derived, sorted by key
    size_t direct_count = 0;
    size_t propagated_count = 0;
    size_t unlinked_count = 0;
    size_t conflict_count = 0;
};

/**
 * @brief Links images to external records by path key, then by group siblings
 *
 * Groups are consulted in precedence order: exact-duplicate groups first,
 * then each similarity partition in the order passed in. The first group of
 * an image that contains a directly linked sibling decides the outcome.
 * Propagation never crosses from one group to another. An image whose key
 * is carried by several external records is a CONFLICT and links nowhere.
 */
class RecordLinker
{
public:
    RecordLinker(const std::vector<ExternalRecord> &external_records, const PathKeyExtractor &extractor);

    LinkageReport link(const std::vector<ImageRecord> &records,
                       const ExactDuplicateReport &exact_report,
                       const std::vector<std::vector<SimilarityGroup>> &similarity_partitions) const;

    // Record id for a derived key, empty unless exactly one external record carries it
    std::string lookupRecordId(const std::string &code_and_number) const;

    // All distinct record ids carrying the key, sorted
    std::vector<std::string> lookupRecordIds(const std::string &code_and_number) const;

    size_t ambiguousKeyCount() const { return ambiguous_keys_; }

private:
    struct GroupView
    {
        GroupRef ref;
        const std::vector<std::string> *file_paths;
    };

    static bool recordIdLess(const std::string &a, const std::string &b);

    const PathKeyExtractor &extractor_;
    std::map<std::string, std::vector<std::string>> record_ids_by_key_;
    size_t ambiguous_keys_ = 0;
};
