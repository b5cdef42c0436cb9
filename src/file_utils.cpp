#include "core/file_utils.hpp"
#include "logging/logger.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <set>

void FileUtils::scanDirectoryRecursively(const std::string &dir_path, std::function<void(const std::string &)> onNext)
{
    std::function<void(const fs::path &)> scanDirectory = [&](const fs::path &current_path)
    {
        try
        {
            for (const auto &entry : fs::directory_iterator(current_path))
            {
                try
                {
                    if (entry.is_regular_file())
                    {
                        onNext(entry.path().string());
                    }
                    else if (entry.is_directory())
                    {
                        scanDirectory(entry.path());
                    }
                }
                catch (const fs::filesystem_error &e)
                {
                    Logger::warn("Skipping entry due to permission error: " + entry.path().string() + " - " + e.what());
                    continue;
                }
            }
        }
        catch (const fs::filesystem_error &e)
        {
            // Keep scanning the rest of the tree
            Logger::warn("Error accessing directory " + current_path.string() + ": " + e.what());
        }
    };
    scanDirectory(fs::path(dir_path));
}

bool FileUtils::isValidDirectory(const std::string &path)
{
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_directory(path, ec);
}

std::string FileUtils::getFileExtension(const std::string &file_path)
{
    std::string ext = fs::path(file_path).extension().string();
    if (!ext.empty() && ext.front() == '.')
        ext.erase(0, 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                   { return static_cast<char>(std::tolower(c)); });
    return ext;
}

std::vector<std::string> FileUtils::listImageFiles(const std::string &root, const std::vector<std::string> &extensions)
{
    std::vector<std::string> files;
    if (!isValidDirectory(root))
    {
        Logger::error("Not a directory: " + root);
        return files;
    }

    std::set<std::string> wanted(extensions.begin(), extensions.end());
    size_t skipped = 0;
    scanDirectoryRecursively(root, [&](const std::string &path)
                             {
        if (wanted.count(getFileExtension(path)))
            files.push_back(path);
        else
            ++skipped; });

    std::sort(files.begin(), files.end());
    Logger::info("Found " + std::to_string(files.size()) + " image files under " + root + " (" +
                 std::to_string(skipped) + " other files ignored)");
    return files;
}

std::optional<std::vector<uint8_t>> FileUtils::readFileBytes(const std::string &file_path)
{
    std::ifstream file(file_path, std::ios::binary);
    if (!file.is_open())
    {
        Logger::warn("Cannot open file: " + file_path);
        return std::nullopt;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad())
    {
        Logger::warn("Read error on file: " + file_path);
        return std::nullopt;
    }
    return bytes;
}
