#include "core/analysis_pipeline.hpp"
#include "core/exact_duplicate_classifier.hpp"
#include "core/file_utils.hpp"
#include "core/fingerprint_service.hpp"
#include "core/metadata_source.hpp"
#include "core/poco_config_manager.hpp"
#include "core/quality_ranker.hpp"
#include "core/record_linker.hpp"
#include "core/report_exporter.hpp"
#include "core/similarity_classifier.hpp"
#include "database/database_manager.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iterator>
#include <memory>
#include <stdexcept>
#include <utility>

PipelineOptions PipelineOptions::fromConfig(const PocoConfigManager &config)
{
    PipelineOptions options;
    options.image_extensions = config.getImageExtensions();
    options.records_path = config.getRecordsPath();
    options.columns.id = config.getRecordIdColumn();
    options.columns.accession = config.getAccessionColumn();
    options.columns.inventory = config.getInventoryColumn();
    options.columns.suffix = config.getSuffixColumn();
    options.path_layout = PathKeyExtractor::layoutFromString(config.getPathLayout());
    options.scan_root = config.getScanRoot();
    options.filename_pattern = config.getFilenamePattern();
    options.unlinked_markers = config.getUnlinkedMarkers();
    options.include_average_hash = config.getIncludeAverageHash();
    options.metadata_source = config.getMetadataSource();
    options.exiftool_path = config.getExifToolPath();
    options.max_hashing_threads = static_cast<size_t>(std::max(1, config.getMaxHashingThreads()));
    options.database_path = config.getDatabasePath();
    options.output_directory = config.getOutputDirectory();
    return options;
}

AnalysisPipeline::AnalysisPipeline(PipelineOptions options)
    : options_(std::move(options))
{
}

PipelineResult AnalysisPipeline::failure(const std::string &message)
{
    Logger::error(message);
    PipelineResult result;
    result.success = false;
    result.error_message = message;
    return result;
}

PipelineResult AnalysisPipeline::run(const std::vector<ImageRecord> &records,
                                     const std::vector<ExternalRecord> &external_records) const
{
    if (records.empty())
        return failure("No images to analyse");

    bool any_hashed = std::any_of(records.begin(), records.end(), [](const ImageRecord &r)
                                  { return r.isHashed(); });
    if (!any_hashed)
        return failure("Hashing failed for every one of " + std::to_string(records.size()) + " images");

    PipelineResult result;
    AnalysisReport &report = result.report;

    report.records = records;
    std::sort(report.records.begin(), report.records.end(), [](const ImageRecord &a, const ImageRecord &b)
              { return a.file_path < b.file_path; });
    report.external_records = external_records;

    report.exact = ExactDuplicateClassifier::classify(report.records);
    report.perceptual_groups = SimilarityClassifier::classify(report.records, FingerprintKind::PERCEPTUAL_HASH);
    if (options_.include_average_hash)
        report.average_groups = SimilarityClassifier::classify(report.records, FingerprintKind::AVERAGE_HASH);

    RecordIndex index = QualityRanker::buildIndex(report.records);
    report.rankings = QualityRanker::rankDuplicateGroups(report.exact.groups, index);
    for (const auto *partition : {&report.perceptual_groups, &report.average_groups})
    {
        auto rankings = QualityRanker::rankSimilarityGroups(*partition, index);
        std::move(rankings.begin(), rankings.end(), std::back_inserter(report.rankings));
    }

    try
    {
        PathKeyExtractor extractor(options_.path_layout, options_.scan_root, options_.filename_pattern,
                                   options_.unlinked_markers);
        RecordLinker linker(report.external_records, extractor);

        std::vector<std::vector<SimilarityGroup>> partitions = {report.perceptual_groups};
        if (options_.include_average_hash)
            partitions.push_back(report.average_groups);
        report.linkage = linker.link(report.records, report.exact, partitions);
    }
    catch (const std::invalid_argument &e)
    {
        return failure(std::string("Invalid linkage settings: ") + e.what());
    }

    result.success = true;
    Logger::info("Analysis finished: " + std::to_string(report.records.size()) + " images, " +
                 std::to_string(report.exact.groups.size()) + " duplicate groups, " +
                 std::to_string(report.perceptual_groups.size() + report.average_groups.size()) +
                 " similarity groups");
    return result;
}

PipelineResult AnalysisPipeline::runOnDirectory(const std::string &root) const
{
    if (!FileUtils::isValidDirectory(root))
        return failure("Scan root is not a directory: " + root);

    std::vector<std::string> files = FileUtils::listImageFiles(root, options_.image_extensions);
    if (files.empty())
        return failure("No image files found under " + root);

    std::unique_ptr<MetadataSource> metadata_source;
    try
    {
        metadata_source = MetadataSource::create(options_.metadata_source, options_.exiftool_path);
    }
    catch (const std::invalid_argument &e)
    {
        return failure(e.what());
    }

    FingerprintService service(options_.max_hashing_threads);
    std::vector<ImageRecord> records = service.fingerprintAll(files, *metadata_source);

    std::vector<ExternalRecord> external_records;
    size_t skipped_rows = 0;
    if (!options_.records_path.empty())
    {
        RecordCsvReader reader(options_.columns);
        RecordReadResult read_result = reader.read(options_.records_path);
        if (!read_result.success)
            return failure("Cannot load external records: " + read_result.error_message);
        external_records = std::move(read_result.records);
        skipped_rows = read_result.skipped_rows;
    }
    else
    {
        Logger::warn("No external record file configured, every image will be unlinked");
    }

    PipelineOptions options = options_;
    if (options.scan_root.empty())
        options.scan_root = root;
    PipelineResult result = AnalysisPipeline(options).run(records, external_records);
    if (!result.success)
        return result;
    result.report.skipped_record_rows = skipped_rows;

    if (!options_.database_path.empty())
    {
        DatabaseManager db(options_.database_path);
        if (!db.isValid())
            return failure("Cannot open database " + options_.database_path);
        DBOpResult stored = db.storeReport(result.report);
        if (!stored.success)
            return failure("Cannot store analysis report: " + stored.error_message);
    }

    if (!options_.output_directory.empty())
    {
        ExportResult exported = ReportExporter::exportCsv(result.report, options_.output_directory);
        if (!exported.success)
            return failure("Cannot export reports: " + exported.error_message);
    }

    return result;
}
