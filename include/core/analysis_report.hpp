#pragma once

#include <string>
#include <vector>
#include "core/image_record.hpp"
#include "core/quality_ranker.hpp"
#include "core/record_linker.hpp"

/**
 * @brief Everything one analysis run derives from a record set
 */
struct AnalysisReport
{
    std::vector<ImageRecord> records; // Sorted by file_path
    std::vector<ExternalRecord> external_records;
    ExactDuplicateReport exact;
    std::vector<SimilarityGroup> perceptual_groups;
    std::vector<SimilarityGroup> average_groups; // Empty unless the average-hash partition is enabled
    std::vector<GroupRanking> rankings;          // Exact groups first, then similarity groups
    LinkageReport linkage;
    size_t skipped_record_rows = 0;
};

/**
 * @brief Outcome of a pipeline run
 */
struct PipelineResult
{
    bool success = false;
    std::string error_message;
    AnalysisReport report;
};
