#include "core/record_keys.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>
#include <utility>

namespace fs = std::filesystem;

const char *PathKeyExtractor::DEFAULT_FILENAME_PATTERN = "^([A-Za-z]+[0-9]+)_[A-Za-z]*([0-9]+)";

std::optional<std::string> RecordKeys::deriveKey(const std::string &accession,
                                                 const std::string &inventory,
                                                 const std::string &suffix)
{
    std::string acc = trim(accession);
    std::string inv = trim(inventory);
    std::string suf = trim(suffix);

    if (acc.empty() || inv.empty())
        return std::nullopt;
    if (containsSeparator(acc) || containsSeparator(inv) || containsSeparator(suf))
        return std::nullopt;

    return acc + SEPARATOR + stripLeadingZeros(inv) + suf;
}

std::string RecordKeys::trim(const std::string &value)
{
    auto is_space = [](unsigned char c)
    { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(value.begin(), value.end(), is_space);
    auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
    if (begin >= end)
        return "";
    return std::string(begin, end);
}

std::string RecordKeys::stripLeadingZeros(const std::string &value)
{
    bool numeric = !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char c)
                                                 { return std::isdigit(c) != 0; });
    if (!numeric)
        return value;
    size_t first = value.find_first_not_of('0');
    if (first == std::string::npos)
        return "0";
    return value.substr(first);
}

bool RecordKeys::containsSeparator(const std::string &value)
{
    return value.find('\\') != std::string::npos || value.find('/') != std::string::npos;
}

PathKeyExtractor::PathKeyExtractor(PathLayout layout,
                                   std::string root,
                                   const std::string &filename_pattern,
                                   std::vector<std::string> unlinked_markers)
    : layout_(layout), root_(std::move(root)), unlinked_markers_(std::move(unlinked_markers))
{
    try
    {
        pattern_ = std::regex(filename_pattern, std::regex::ECMAScript);
    }
    catch (const std::regex_error &e)
    {
        throw std::invalid_argument("Invalid filename pattern '" + filename_pattern + "': " + e.what());
    }
    if (layout_ == PathLayout::FILENAME && pattern_.mark_count() < 2)
    {
        throw std::invalid_argument("Filename pattern needs two capture groups: " + filename_pattern);
    }
}

PathLayout PathKeyExtractor::layoutFromString(const std::string &layout)
{
    if (layout == "directory" || layout == "DIRECTORY")
        return PathLayout::DIRECTORY;
    if (layout == "filename" || layout == "FILENAME")
        return PathLayout::FILENAME;
    throw std::invalid_argument("Unknown path layout: " + layout);
}

bool PathKeyExtractor::isMarkedUnlinked(const std::string &file_path) const
{
    for (const auto &marker : unlinked_markers_)
    {
        if (!marker.empty() && file_path.find(marker) != std::string::npos)
            return true;
    }
    return false;
}

std::optional<PathKey> PathKeyExtractor::extract(const std::string &file_path) const
{
    if (isMarkedUnlinked(file_path))
        return std::nullopt;

    if (layout_ == PathLayout::DIRECTORY)
        return extractFromDirectories(file_path);
    return extractFromFilename(file_path);
}

std::optional<PathKey> PathKeyExtractor::extractFromDirectories(const std::string &file_path) const
{
    fs::path relative = fs::path(file_path).lexically_relative(fs::path(root_));
    std::vector<std::string> parts;
    for (const auto &part : relative)
        parts.push_back(part.string());

    // accession, inventory and the file name itself
    if (parts.size() < 3 || parts.front() == "..")
        return std::nullopt;

    auto key = RecordKeys::deriveKey(parts[0], parts[1]);
    if (!key)
        return std::nullopt;
    return PathKey{RecordKeys::trim(parts[0]), RecordKeys::stripLeadingZeros(RecordKeys::trim(parts[1])), "", *key};
}

std::optional<PathKey> PathKeyExtractor::extractFromFilename(const std::string &file_path) const
{
    std::string stem = fs::path(file_path).stem().string();
    std::smatch match;
    if (!std::regex_search(stem, match, pattern_))
        return std::nullopt;

    std::string suffix = match.size() > 3 && match[3].matched ? match[3].str() : "";
    auto key = RecordKeys::deriveKey(match[1].str(), match[2].str(), suffix);
    if (!key)
        return std::nullopt;
    return PathKey{RecordKeys::trim(match[1].str()), RecordKeys::stripLeadingZeros(RecordKeys::trim(match[2].str())),
                   RecordKeys::trim(suffix), *key};
}
