#pragma once

#include <string>
#include <vector>
#include "core/image_record.hpp"
#include "core/metadata_source.hpp"

/**
 * @brief Reads, decodes and fingerprints image files in parallel
 *
 * Work is spread with tbb::parallel_for; parallelism is capped with a
 * tbb::global_control for the duration of one fingerprintAll() call.
 */
class FingerprintService
{
public:
    explicit FingerprintService(size_t max_threads = 4);

    /**
     * @brief Fingerprint every file
     * @param file_paths Files to process; duplicates are processed once
     * @param metadata_source Supplies resolution and size attributes
     * @return One record per distinct path, sorted by path. Unreadable or
     *         undecodable files yield records with error_message set.
     */
    std::vector<ImageRecord> fingerprintAll(const std::vector<std::string> &file_paths,
                                            const MetadataSource &metadata_source) const;

    // Read, decode and fingerprint a single file
    static ImageRecord fingerprintFile(const std::string &file_path, const MetadataSource &metadata_source);

    size_t getMaxThreads() const { return max_threads_; }

private:
    size_t max_threads_;
};
