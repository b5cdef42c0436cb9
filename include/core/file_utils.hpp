#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief File utilities for scanning and reading archive images
 */
class FileUtils
{
public:
    /**
     * Scans a directory recursively and calls the provided function for each file.
     * Unreadable entries are logged and skipped.
     * @param dir_path Directory path to scan
     * @param onNext Function to call for each file found
     */
    static void scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext);

    /**
     * Validates if a path is a valid directory
     * @param path Path to validate
     * @return true if path is a valid directory, false otherwise
     */
    static bool isValidDirectory(const std::string &path);

    /**
     * @brief List image files below root, sorted by path
     * @param root Directory to scan recursively
     * @param extensions Lower-case extensions without the dot; matching ignores case
     */
    static std::vector<std::string> listImageFiles(const std::string &root, const std::vector<std::string> &extensions);

    /**
     * @brief Read a whole file into memory
     * @return File bytes, or nullopt when the file cannot be opened or read
     */
    static std::optional<std::vector<uint8_t>> readFileBytes(const std::string &file_path);

    // Lower-case extension without the leading dot
    static std::string getFileExtension(const std::string &file_path);
};
