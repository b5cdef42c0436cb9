#include "core/fingerprint_service.hpp"
#include "core/file_utils.hpp"
#include "core/fingerprinter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <opencv2/imgcodecs.hpp>
#include <tbb/blocked_range.h>
#include <tbb/global_control.h>
#include <tbb/parallel_for.h>

FingerprintService::FingerprintService(size_t max_threads)
    : max_threads_(max_threads == 0 ? 1 : max_threads)
{
}

ImageRecord FingerprintService::fingerprintFile(const std::string &file_path, const MetadataSource &metadata_source)
{
    auto bytes = FileUtils::readFileBytes(file_path);

    cv::Mat image;
    if (bytes && !bytes->empty())
    {
        try
        {
            cv::Mat buffer(1, static_cast<int>(bytes->size()), CV_8UC1, bytes->data());
            image = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
        }
        catch (const cv::Exception &e)
        {
            Logger::warn("Decoder error for " + file_path + ": " + e.what());
            image.release();
        }
    }
    if (image.empty())
        Logger::debug("Could not decode " + file_path);

    ImageRecord record = Fingerprinter::buildRecord(file_path, bytes, image);

    ImageMetadata metadata = metadata_source.read(file_path, image);
    record.x_resolution = metadata.x_resolution;
    record.y_resolution = metadata.y_resolution;
    if (metadata.file_size)
        record.file_size = metadata.file_size;

    return record;
}

std::vector<ImageRecord> FingerprintService::fingerprintAll(const std::vector<std::string> &file_paths,
                                                            const MetadataSource &metadata_source) const
{
    std::vector<std::string> paths(file_paths);
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());

    std::vector<ImageRecord> records(paths.size());
    if (paths.empty())
        return records;

    Logger::info("Fingerprinting " + std::to_string(paths.size()) + " files with up to " +
                 std::to_string(max_threads_) + " threads (metadata: " + metadata_source.getName() + ")");
    auto start = std::chrono::steady_clock::now();

    tbb::global_control limit(tbb::global_control::max_allowed_parallelism, max_threads_);
    std::atomic<size_t> failures{0};

    // Each index is written by exactly one task
    tbb::parallel_for(tbb::blocked_range<size_t>(0, paths.size()),
                      [&](const tbb::blocked_range<size_t> &range)
                      {
                          for (size_t i = range.begin(); i != range.end(); ++i)
                          {
                              try
                              {
                                  records[i] = fingerprintFile(paths[i], metadata_source);
                              }
                              catch (const std::exception &e)
                              {
                                  Logger::error("Fingerprinting failed for " + paths[i] + ": " + e.what());
                                  records[i] = ImageRecord();
                                  records[i].file_path = paths[i];
                                  records[i].error_message = std::string("fingerprinting failed: ") + e.what();
                              }
                              if (!records[i].isHashed())
                                  ++failures;
                          }
                      });

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    Logger::info("Fingerprinted " + std::to_string(records.size()) + " files in " +
                 std::to_string(elapsed.count()) + " ms, " + std::to_string(failures.load()) + " unhashed");
    return records;
}
