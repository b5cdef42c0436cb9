#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "core/image_record.hpp"

/**
 * @brief Pure fingerprint computation for one image
 *
 * Takes raw file bytes and decoded pixels supplied by the caller and never
 * touches the filesystem. Byte digests never depend on the decode outcome.
 */
class Fingerprinter
{
public:
    /**
     * @brief SHA-256 of the raw bytes
     * @return 64 lowercase hex characters, empty if OpenSSL reports a failure
     */
    static std::string computeContentDigest(const std::vector<uint8_t> &bytes);

    /**
     * @brief Fast byte-average digest of the raw bytes
     *
     * The bytes are split into 64 equal blocks; bit i is set when the mean of
     * block i exceeds the mean over the whole input. The length of the input
     * is folded in afterwards.
     * @return 16 lowercase hex characters
     */
    static std::string computeWeakDigest(const std::vector<uint8_t> &bytes);

    /// 8x8 grayscale mean hash, empty optional for an empty image
    static std::optional<std::string> computeAverageHash(const cv::Mat &image);

    /// 32x32 DCT hash of the low-frequency 8x8 block, empty optional for an empty image
    static std::optional<std::string> computePerceptualHash(const cv::Mat &image);

    /// Number of distinct 8-bit RGB triples, empty optional for an empty image
    static std::optional<int64_t> countUniqueColors(const cv::Mat &image);

    /**
     * @brief Build a record from bytes and pixels
     * @param file_path Identity of the record
     * @param bytes Raw file content, nullopt when the file could not be read
     * @param image Decoded pixels, empty when decoding failed
     */
    static ImageRecord buildRecord(const std::string &file_path,
                                   const std::optional<std::vector<uint8_t>> &bytes,
                                   const cv::Mat &image);

    static std::string toHex(uint64_t bits);

private:
    static cv::Mat toGray8(const cv::Mat &image);
    static cv::Mat toBgr8(const cv::Mat &image);
};
