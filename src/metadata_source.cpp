#include "core/metadata_source.hpp"
#include "logging/logger.hpp"
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <utility>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::unique_ptr<MetadataSource> MetadataSource::create(const std::string &name, const std::string &exiftool_path)
{
    if (name == "decoder")
        return std::make_unique<DecoderMetadataSource>();
    if (name == "exiftool")
        return std::make_unique<ExifToolMetadataSource>(exiftool_path);
    throw std::invalid_argument("Unknown metadata source: " + name);
}

ImageMetadata DecoderMetadataSource::read(const std::string &file_path, const cv::Mat &image) const
{
    ImageMetadata metadata;
    if (image.empty())
    {
        Logger::debug("No decoded pixels for " + file_path + ", resolution unknown");
        return metadata;
    }
    metadata.x_resolution = image.cols;
    metadata.y_resolution = image.rows;
    return metadata;
}

ExifToolMetadataSource::ExifToolMetadataSource(std::string executable)
    : executable_(std::move(executable))
{
}

std::string ExifToolMetadataSource::shellQuote(const std::string &value)
{
    std::string quoted = "'";
    for (char c : value)
    {
        if (c == '\'')
            quoted += "'\\''";
        else
            quoted += c;
    }
    quoted += "'";
    return quoted;
}

ImageMetadata ExifToolMetadataSource::read(const std::string &file_path, const cv::Mat &) const
{
    std::string command = shellQuote(executable_) + " -json -n -FileSize -XResolution -YResolution " +
                          shellQuote(file_path) + " 2>/dev/null";
    FILE *pipe = popen(command.c_str(), "r");
    if (!pipe)
    {
        Logger::error("Failed to execute exiftool for " + file_path);
        return {};
    }

    std::string output;
    char buffer[4096];
    size_t n;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0)
        output.append(buffer, n);

    int status = pclose(pipe);
    if (status != 0)
        Logger::warn("exiftool exited with status " + std::to_string(status) + " for " + file_path);

    ImageMetadata metadata = parseOutput(output);
    if (!metadata.x_resolution || !metadata.y_resolution)
        Logger::debug("exiftool reported no resolution for " + file_path);
    return metadata;
}

ImageMetadata ExifToolMetadataSource::parseOutput(const std::string &json_text)
{
    ImageMetadata metadata;
    json parsed = json::parse(json_text, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_array() || parsed.empty() || !parsed[0].is_object())
        return metadata;

    const json &entry = parsed[0];
    // Values outside [0, max] are treated as absent
    auto number = [&entry](const char *key, double max) -> std::optional<int64_t>
    {
        auto it = entry.find(key);
        if (it == entry.end() || !it->is_number())
            return std::nullopt;
        double value = it->get<double>();
        if (!std::isfinite(value) || value < 0.0 || value > max)
        {
            Logger::warn(std::string("exiftool ") + key + " out of range: " + it->dump());
            return std::nullopt;
        }
        return static_cast<int64_t>(std::llround(value));
    };

    metadata.file_size = number("FileSize", MAX_FILE_SIZE);
    metadata.x_resolution = number("XResolution", MAX_RESOLUTION);
    metadata.y_resolution = number("YResolution", MAX_RESOLUTION);
    return metadata;
}
