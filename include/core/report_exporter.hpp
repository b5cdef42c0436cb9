#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/analysis_report.hpp"

struct ExportResult
{
    bool success = false;
    std::string error_message;
    std::vector<std::string> written_files;
};

/**
 * @brief Writes an analysis report as CSV files and a JSON summary
 */
class ReportExporter
{
public:
    /**
     * @brief Export to directory, creating it when missing
     *
     * Files: exact_duplicates.csv, collision_candidates.csv,
     * similar_images.csv, ranked_members.csv, linkage_results.csv,
     * linkage_conflicts.csv, ambiguous_record_keys.csv, unhashed_files.csv
     * and summary.json.
     */
    static ExportResult exportCsv(const AnalysisReport &report, const std::string &directory);

    static nlohmann::json buildSummary(const AnalysisReport &report);

    // Quote a CSV field when it holds a comma, quote or line break
    static std::string escapeCsvField(const std::string &field);

private:
    static bool writeCsv(const std::string &path,
                         const std::vector<std::string> &header,
                         const std::vector<std::vector<std::string>> &rows);
};
