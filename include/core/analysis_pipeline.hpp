#pragma once

#include <string>
#include <vector>
#include "core/analysis_report.hpp"
#include "core/record_csv_reader.hpp"
#include "core/record_keys.hpp"

class PocoConfigManager;

/**
 * @brief Settings of one analysis run
 */
struct PipelineOptions
{
    std::vector<std::string> image_extensions = {"jpg", "jpeg", "png", "tif", "tiff", "bmp"};
    std::string records_path;
    RecordColumns columns;
    PathLayout path_layout = PathLayout::FILENAME;
    std::string scan_root; // Base of the directory layout
    std::string filename_pattern = PathKeyExtractor::DEFAULT_FILENAME_PATTERN;
    std::vector<std::string> unlinked_markers = {"_OGK", "_OGKB"};
    bool include_average_hash = false;
    std::string metadata_source = "decoder";
    std::string exiftool_path = "exiftool";
    size_t max_hashing_threads = 4;
    std::string database_path; // Empty disables persistence
    std::string output_directory; // Empty disables export

    static PipelineOptions fromConfig(const PocoConfigManager &config);
};

/**
 * @brief Classification, ranking and linkage over one record set
 *
 * run() works on records already in memory. runOnDirectory() first
 * enumerates and fingerprints the files and reads the external records,
 * then persists and exports the report.
 */
class AnalysisPipeline
{
public:
    explicit AnalysisPipeline(PipelineOptions options);

    /**
     * @brief Analyse an in-memory record set
     * @return Failed result when records is empty, when no record could be
     *         hashed or when the linkage settings are invalid
     */
    PipelineResult run(const std::vector<ImageRecord> &records,
                       const std::vector<ExternalRecord> &external_records) const;

    PipelineResult runOnDirectory(const std::string &root) const;

    const PipelineOptions &getOptions() const { return options_; }

private:
    static PipelineResult failure(const std::string &message);

    PipelineOptions options_;
};
