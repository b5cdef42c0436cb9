#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

/**
 * @brief Derivation of the accession/inventory join key
 */
class RecordKeys
{
public:
    static constexpr char SEPARATOR = '\\';

    /**
     * @brief Build the codeAndNumber key joining images to external records
     *
     * Fields are trimmed, a purely numeric inventory loses its leading zeros
     * and the result is accession + '\' + inventory + suffix.
     * @return nullopt when accession or inventory is empty, or when any field
     *         contains a path separator
     */
    static std::optional<std::string> deriveKey(const std::string &accession,
                                                const std::string &inventory,
                                                const std::string &suffix = "");

    static std::string trim(const std::string &value);
    static std::string stripLeadingZeros(const std::string &value);
    static bool containsSeparator(const std::string &value);
};

enum class PathLayout
{
    DIRECTORY, // root/<accession>/<inventory>/file
    FILENAME   // accession and inventory captured from the file stem
};

struct PathKey
{
    std::string accession;
    std::string inventory;
    std::string suffix;
    std::string key;
};

/**
 * @brief Reads the record key encoded in an image's file path
 */
class PathKeyExtractor
{
public:
    static const char *DEFAULT_FILENAME_PATTERN;

    /**
     * @param layout Where the identifiers live in the path
     * @param root Scan root, used by the DIRECTORY layout
     * @param filename_pattern Regex with two capture groups (accession, inventory)
     *        and an optional third (suffix), used by the FILENAME layout
     * @param unlinked_markers Substrings marking a file as deliberately unlinked
     * @throws std::invalid_argument if the pattern does not compile
     */
    PathKeyExtractor(PathLayout layout,
                     std::string root = "",
                     const std::string &filename_pattern = DEFAULT_FILENAME_PATTERN,
                     std::vector<std::string> unlinked_markers = {"_OGK", "_OGKB"});

    std::optional<PathKey> extract(const std::string &file_path) const;

    bool isMarkedUnlinked(const std::string &file_path) const;

    static PathLayout layoutFromString(const std::string &layout);

private:
    std::optional<PathKey> extractFromDirectories(const std::string &file_path) const;
    std::optional<PathKey> extractFromFilename(const std::string &file_path) const;

    PathLayout layout_;
    std::string root_;
    std::regex pattern_;
    std::vector<std::string> unlinked_markers_;
};
