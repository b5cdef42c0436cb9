#include "core/fingerprinter.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>
#include <openssl/sha.h>
#include <opencv2/imgproc.hpp>

std::string Fingerprinter::computeContentDigest(const std::vector<uint8_t> &bytes)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256_CTX sha256;
    if (SHA256_Init(&sha256) != 1)
        return "";
    if (!bytes.empty() && SHA256_Update(&sha256, bytes.data(), bytes.size()) != 1)
        return "";
    if (SHA256_Final(hash, &sha256) != 1)
        return "";
    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i)
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    return ss.str();
}

std::string Fingerprinter::computeWeakDigest(const std::vector<uint8_t> &bytes)
{
    constexpr size_t block_count = 64;
    const size_t n = bytes.size();
    if (n == 0)
        return toHex(0);

    uint64_t total = 0;
    for (uint8_t b : bytes)
        total += b;

    uint64_t bits = 0;
    for (size_t i = 0; i < block_count; ++i)
    {
        size_t begin = i * n / block_count;
        size_t end = (i + 1) * n / block_count;
        if (begin == end)
            continue;
        uint64_t block_sum = 0;
        for (size_t j = begin; j < end; ++j)
            block_sum += bytes[j];
        // block_sum / block_len > total / n, without floating point
        if (block_sum * n > total * (end - begin))
            bits |= (uint64_t{1} << (block_count - 1 - i));
    }

    bits ^= static_cast<uint64_t>(n) * 0x9E3779B97F4A7C15ULL;
    return toHex(bits);
}

std::optional<std::string> Fingerprinter::computeAverageHash(const cv::Mat &image)
{
    if (image.empty())
        return std::nullopt;

    cv::Mat resized_image;
    cv::resize(toGray8(image), resized_image, cv::Size(8, 8), 0, 0, cv::INTER_AREA);

    double mean = cv::mean(resized_image)[0];
    uint64_t bits = 0;
    int bit_position = 0;
    for (int y = 0; y < 8; y++)
    {
        for (int x = 0; x < 8; x++)
        {
            if (resized_image.at<uint8_t>(y, x) > mean)
                bits |= (uint64_t{1} << (63 - bit_position));
            bit_position++;
        }
    }
    return toHex(bits);
}

std::optional<std::string> Fingerprinter::computePerceptualHash(const cv::Mat &image)
{
    if (image.empty())
        return std::nullopt;

    // Resize to 32x32 for pHash (perceptual hash)
    cv::Mat resized_image;
    cv::resize(toGray8(image), resized_image, cv::Size(32, 32), 0, 0, cv::INTER_AREA);

    cv::Mat float_image;
    resized_image.convertTo(float_image, CV_32F);

    cv::Mat dct_image;
    cv::dct(float_image, dct_image);

    // Top-left 8x8 DCT coefficients are the low frequency components
    cv::Mat dct_8x8 = dct_image(cv::Rect(0, 0, 8, 8));

    std::vector<float> dct_values;
    dct_values.reserve(64);
    for (int y = 0; y < 8; y++)
        for (int x = 0; x < 8; x++)
            dct_values.push_back(dct_8x8.at<float>(y, x));

    std::vector<float> sorted_values = dct_values;
    std::sort(sorted_values.begin(), sorted_values.end());
    float median = (sorted_values[31] + sorted_values[32]) / 2.0f;

    uint64_t bits = 0;
    for (size_t i = 0; i < dct_values.size(); ++i)
    {
        if (dct_values[i] > median)
            bits |= (uint64_t{1} << (63 - i));
    }
    return toHex(bits);
}

std::optional<int64_t> Fingerprinter::countUniqueColors(const cv::Mat &image)
{
    if (image.empty())
        return std::nullopt;

    cv::Mat bgr = toBgr8(image);
    // One bit per 24-bit colour, independent of the image size
    std::vector<bool> seen(size_t(1) << 24, false);
    int64_t count = 0;
    for (int y = 0; y < bgr.rows; y++)
    {
        const cv::Vec3b *row = bgr.ptr<cv::Vec3b>(y);
        for (int x = 0; x < bgr.cols; x++)
        {
            size_t color = (static_cast<size_t>(row[x][2]) << 16) |
                           (static_cast<size_t>(row[x][1]) << 8) |
                           static_cast<size_t>(row[x][0]);
            if (!seen[color])
            {
                seen[color] = true;
                ++count;
            }
        }
    }
    return count;
}

ImageRecord Fingerprinter::buildRecord(const std::string &file_path,
                                       const std::optional<std::vector<uint8_t>> &bytes,
                                       const cv::Mat &image)
{
    ImageRecord record;
    record.file_path = file_path;

    if (bytes)
    {
        std::string content = computeContentDigest(*bytes);
        if (!content.empty())
        {
            record.content_digest = content;
            record.weak_digest = computeWeakDigest(*bytes);
        }
        else
        {
            record.error_message = "content digest computation failed";
        }
        record.file_size = static_cast<int64_t>(bytes->size());
    }
    else
    {
        record.error_message = "file could not be read";
    }

    try
    {
        record.average_hash = computeAverageHash(image);
        record.perceptual_hash = computePerceptualHash(image);
        record.num_unique_colors = countUniqueColors(image);
    }
    catch (const cv::Exception &e)
    {
        Logger::warn("Image hashing failed for " + file_path + ": " + e.what());
        record.average_hash.reset();
        record.perceptual_hash.reset();
        record.num_unique_colors.reset();
        if (record.error_message.empty())
            record.error_message = std::string("image hashing failed: ") + e.what();
    }

    if (image.empty() && record.error_message.empty())
        record.error_message = "image could not be decoded";

    return record;
}

std::string Fingerprinter::toHex(uint64_t bits)
{
    std::stringstream ss;
    ss << std::hex << std::setw(16) << std::setfill('0') << bits;
    return ss.str();
}

cv::Mat Fingerprinter::toGray8(const cv::Mat &image)
{
    cv::Mat bgr = toBgr8(image);
    cv::Mat gray_image;
    cv::cvtColor(bgr, gray_image, cv::COLOR_BGR2GRAY);
    return gray_image;
}

cv::Mat Fingerprinter::toBgr8(const cv::Mat &image)
{
    cv::Mat depth8;
    if (image.depth() == CV_8U)
        depth8 = image;
    else if (image.depth() == CV_16U)
        image.convertTo(depth8, CV_8U, 1.0 / 257.0);
    else
        image.convertTo(depth8, CV_8U);

    cv::Mat bgr;
    switch (depth8.channels())
    {
    case 1:
        cv::cvtColor(depth8, bgr, cv::COLOR_GRAY2BGR);
        break;
    case 4:
        cv::cvtColor(depth8, bgr, cv::COLOR_BGRA2BGR);
        break;
    case 3:
        bgr = depth8;
        break;
    default:
        CV_Error(cv::Error::StsBadArg, "unsupported channel count: " + std::to_string(depth8.channels()));
    }
    return bgr;
}
