#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <opencv2/core.hpp>

/**
 * @brief Image attributes that feed the quality ranking
 */
struct ImageMetadata
{
    std::optional<int64_t> x_resolution;
    std::optional<int64_t> y_resolution;
    std::optional<int64_t> file_size;
};

/**
 * @brief Source of resolution and size attributes for an image file
 *
 * Implementations never throw for a single bad file; missing values stay
 * empty and are logged.
 */
class MetadataSource
{
public:
    virtual ~MetadataSource() = default;

    virtual ImageMetadata read(const std::string &file_path, const cv::Mat &image) const = 0;

    virtual std::string getName() const = 0;

    /**
     * @brief Create the source named in the configuration
     * @param name "decoder" or "exiftool"
     * @param exiftool_path Executable used by the exiftool source
     * @throws std::invalid_argument for an unknown name
     */
    static std::unique_ptr<MetadataSource> create(const std::string &name, const std::string &exiftool_path = "exiftool");
};

// Pixel dimensions of the decoded image
class DecoderMetadataSource : public MetadataSource
{
public:
    ImageMetadata read(const std::string &file_path, const cv::Mat &image) const override;
    std::string getName() const override { return "decoder"; }
};

/**
 * @brief Reads FileSize, XResolution and YResolution through exiftool
 *
 * Runs `exiftool -json -n` per file and parses the first JSON object of its
 * output.
 */
class ExifToolMetadataSource : public MetadataSource
{
public:
    // Largest accepted resolution (INT32_MAX) and file size (2^53, exact in a double)
    static constexpr double MAX_RESOLUTION = 2147483647.0;
    static constexpr double MAX_FILE_SIZE = 9007199254740992.0;

    explicit ExifToolMetadataSource(std::string executable = "exiftool");

    ImageMetadata read(const std::string &file_path, const cv::Mat &image) const override;
    std::string getName() const override { return "exiftool"; }

    /**
     * @brief Parse exiftool JSON output
     * @return Extracted values; all empty when the text is not the expected JSON
     */
    static ImageMetadata parseOutput(const std::string &json_text);

    // Wrap a value in single quotes for /bin/sh
    static std::string shellQuote(const std::string &value);

private:
    std::string executable_;
};
