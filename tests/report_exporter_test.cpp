#include <gtest/gtest.h>
#include "core/report_exporter.hpp"
#include "core/analysis_pipeline.hpp"
#include "test_base.hpp"
#include <fstream>
#include <sstream>

class ReportExporterTest : public TestBase
{
protected:
    // An exact pair linked through ACC1_INV1.jpg, an unrelated image and an unreadable file
    static AnalysisReport sampleReport()
    {
        std::vector<ImageRecord> records = {
            makeRecord("ACC1_INV1.jpg", "sha", "w", std::string("p1"), 1024, 768, 100),
            makeRecord("copy, with comma.jpg", "sha", "w", std::string("p1"), 800, 600, 100),
            makeRecord("other.jpg", "s2", "w2", std::string("p9"), 640, 480, 10),
        };
        ImageRecord unreadable;
        unreadable.file_path = "unreadable.jpg";
        unreadable.error_message = "file could not be read";
        records.push_back(unreadable);

        ExternalRecord record;
        record.record_id = "R1";
        record.accession = "ACC1";
        record.inventory = "1";
        record.code_and_number = RecordKeys::deriveKey("ACC1", "1").value();

        PipelineResult result = AnalysisPipeline(PipelineOptions()).run(records, {record});
        EXPECT_TRUE(result.success) << result.error_message;
        return result.report;
    }

    static std::vector<std::string> readLines(const std::string &path)
    {
        std::ifstream in(path);
        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);
        return lines;
    }
};

TEST_F(ReportExporterTest, EscapeCsvField)
{
    EXPECT_EQ(ReportExporter::escapeCsvField("plain"), "plain");
    EXPECT_EQ(ReportExporter::escapeCsvField(""), "");
    EXPECT_EQ(ReportExporter::escapeCsvField("a,b"), "\"a,b\"");
    EXPECT_EQ(ReportExporter::escapeCsvField("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(ReportExporter::escapeCsvField("two\nlines"), "\"two\nlines\"");
}

TEST_F(ReportExporterTest, WritesEveryReportFile)
{
    AnalysisReport report = sampleReport();
    std::string out_dir = getTestDir() + "/nested/reports";

    ExportResult result = ReportExporter::exportCsv(report, out_dir);

    ASSERT_TRUE(result.success) << result.error_message;
    EXPECT_EQ(result.written_files.size(), 9u);
    for (const auto &path : result.written_files)
        EXPECT_TRUE(std::filesystem::exists(path)) << path;

    auto exact = readLines(out_dir + "/exact_duplicates.csv");
    ASSERT_EQ(exact.size(), 3u);
    EXPECT_EQ(exact[0], "group_key,content_digest,weak_digest,file_path");
    EXPECT_NE(exact[1].find("ACC1_INV1.jpg"), std::string::npos);
    EXPECT_NE(exact[2].find("\"copy, with comma.jpg\""), std::string::npos);

    auto unhashed = readLines(out_dir + "/unhashed_files.csv");
    ASSERT_EQ(unhashed.size(), 2u);
    EXPECT_EQ(unhashed[1], "unreadable.jpg,file could not be read");

    auto linkage = readLines(out_dir + "/linkage_results.csv");
    EXPECT_EQ(linkage.size(), 1u + report.records.size());
}

TEST_F(ReportExporterTest, SummaryCounts)
{
    AnalysisReport report = sampleReport();
    report.skipped_record_rows = 3;

    nlohmann::json summary = ReportExporter::buildSummary(report);

    EXPECT_EQ(summary["images"]["total"], 4);
    EXPECT_EQ(summary["images"]["hashed"], 3);
    EXPECT_EQ(summary["images"]["unhashed"], 1);
    EXPECT_EQ(summary["exact_duplicates"]["groups"], 1);
    EXPECT_EQ(summary["linkage"]["external_records"], 1);
    EXPECT_EQ(summary["linkage"]["skipped_record_rows"], 3);
    EXPECT_EQ(summary["linkage"]["direct"], 1);
    EXPECT_EQ(summary["linkage"]["propagated"], 1);
    EXPECT_EQ(summary["linkage"]["unlinked"], 2);
    EXPECT_EQ(summary["linkage"]["conflict"], 0);
    EXPECT_EQ(summary["linkage"]["ambiguous_keys"], 0);
}

TEST_F(ReportExporterTest, FailsWhenDirectoryCannotBeCreated)
{
    std::string blocker = writeFile("blocker", "a regular file");

    ExportResult result = ReportExporter::exportCsv(AnalysisReport(), blocker + "/reports");

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error_message.empty());
    EXPECT_TRUE(result.written_files.empty());
}
