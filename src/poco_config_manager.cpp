#include "core/poco_config_manager.hpp"
#include "core/record_keys.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <functional>
#include <sstream>
#include <stdexcept>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
    {
        Logger::warn("Config file not readable: " + path);
        return false;
    }
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse config file " + path + ": " + e.displayText());
        return false;
    }
    Logger::info("Configuration loaded from " + path);
    return true;
}

bool PocoConfigManager::save(const std::string &path) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ofstream out(path);
    if (!out.is_open())
        return false;
    cfg_->save(out);
    return true;
}

nlohmann::json PocoConfigManager::getAll() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::stringstream ss;
    cfg_->save(ss);
    return nlohmann::json::parse(ss.str());
}

void PocoConfigManager::update(const nlohmann::json &patch)
{
    std::lock_guard<std::mutex> lock(mutex_);
    // Flatten and set values
    std::function<void(const std::string &, const nlohmann::json &)> apply;
    apply = [&](const std::string &prefix, const nlohmann::json &node)
    {
        if (node.is_object())
        {
            for (auto it = node.begin(); it != node.end(); ++it)
            {
                std::string key = prefix.empty() ? it.key() : (prefix + "." + it.key());
                apply(key, it.value());
            }
        }
        else if (!node.is_null())
        {
            if (node.is_boolean())
                cfg_->setBool(prefix, node.get<bool>());
            else if (node.is_number_integer())
                cfg_->setInt(prefix, node.get<int>());
            else if (node.is_number_float())
                cfg_->setDouble(prefix, node.get<double>());
            else if (node.is_string())
                cfg_->setString(prefix, node.get<std::string>());
            else
                cfg_->setString(prefix, node.dump());
        }
    };
    apply("", patch);
}

void PocoConfigManager::resetToDefaults()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cfg_ = new JSONConfiguration();
    }
    initializeDefaultConfig();
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

bool PocoConfigManager::getBool(const std::string &key, bool def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getBool(key, def);
}

bool PocoConfigManager::hasKey(const std::string &key) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->hasProperty(key);
}

std::string PocoConfigManager::getLogLevel() const
{
    return getString("log_level", "INFO");
}

std::string PocoConfigManager::getScanRoot() const
{
    return getString("scan.root", "");
}

std::vector<std::string> PocoConfigManager::getImageExtensions() const
{
    std::vector<std::string> extensions = split(getString("scan.image_extensions", "jpg,jpeg,png,tif,tiff,bmp"), ',');
    for (auto &ext : extensions)
    {
        std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });
        if (!ext.empty() && ext.front() == '.')
            ext.erase(0, 1);
    }
    return extensions;
}

std::string PocoConfigManager::getDatabasePath() const
{
    return getString("database.path", "archive_dedup.db");
}

std::string PocoConfigManager::getOutputDirectory() const
{
    return getString("output.directory", "processed");
}

std::string PocoConfigManager::getRecordsPath() const
{
    return getString("records.path", "");
}

std::string PocoConfigManager::getRecordIdColumn() const
{
    return getString("records.columns.id", "ID");
}

std::string PocoConfigManager::getAccessionColumn() const
{
    return getString("records.columns.accession", "CODE");
}

std::string PocoConfigManager::getInventoryColumn() const
{
    return getString("records.columns.inventory", "NUMMER");
}

std::string PocoConfigManager::getSuffixColumn() const
{
    return getString("records.columns.suffix", "CODE_1");
}

std::string PocoConfigManager::getPathLayout() const
{
    return getString("linkage.path_layout", "filename");
}

std::string PocoConfigManager::getFilenamePattern() const
{
    return getString("linkage.filename_pattern", PathKeyExtractor::DEFAULT_FILENAME_PATTERN);
}

std::vector<std::string> PocoConfigManager::getUnlinkedMarkers() const
{
    return split(getString("linkage.unlinked_markers", "_OGK,_OGKB"), ',');
}

bool PocoConfigManager::getIncludeAverageHash() const
{
    return getBool("similarity.include_average_hash", false);
}

std::string PocoConfigManager::getMetadataSource() const
{
    return getString("metadata.source", "decoder");
}

std::string PocoConfigManager::getExifToolPath() const
{
    return getString("metadata.exiftool_path", "exiftool");
}

int PocoConfigManager::getMaxHashingThreads() const
{
    return getInt("threading.max_hashing_threads", 4);
}

bool PocoConfigManager::validateConfig() const
{
    std::string log_level = getLogLevel();
    if (!Logger::isValidLevel(log_level))
    {
        Logger::error("Invalid log level: " + log_level);
        return false;
    }

    std::string layout = getPathLayout();
    if (layout != "filename" && layout != "directory")
    {
        Logger::error("Invalid linkage.path_layout: " + layout);
        return false;
    }

    try
    {
        PathKeyExtractor probe(PathKeyExtractor::layoutFromString(layout), getScanRoot(), getFilenamePattern());
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error(std::string("Invalid linkage configuration: ") + e.what());
        return false;
    }

    std::string source = getMetadataSource();
    if (source != "decoder" && source != "exiftool")
    {
        Logger::error("Invalid metadata.source: " + source);
        return false;
    }

    int threads = getMaxHashingThreads();
    if (threads < 1 || threads > 256)
    {
        Logger::error("Invalid threading.max_hashing_threads: " + std::to_string(threads));
        return false;
    }

    if (getImageExtensions().empty())
    {
        Logger::error("scan.image_extensions is empty");
        return false;
    }

    if (getDatabasePath().empty())
    {
        Logger::error("database.path is empty");
        return false;
    }

    return true;
}

void PocoConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(mutex_);

    cfg_->setString("log_level", "INFO");

    cfg_->setString("scan.root", "");
    cfg_->setString("scan.image_extensions", "jpg,jpeg,png,tif,tiff,bmp");

    cfg_->setString("database.path", "archive_dedup.db");
    cfg_->setString("output.directory", "processed");

    cfg_->setString("records.path", "");
    cfg_->setString("records.columns.id", "ID");
    cfg_->setString("records.columns.accession", "CODE");
    cfg_->setString("records.columns.inventory", "NUMMER");
    cfg_->setString("records.columns.suffix", "CODE_1");

    cfg_->setString("linkage.path_layout", "filename");
    cfg_->setString("linkage.filename_pattern", PathKeyExtractor::DEFAULT_FILENAME_PATTERN);
    cfg_->setString("linkage.unlinked_markers", "_OGK,_OGKB");

    cfg_->setBool("similarity.include_average_hash", false);

    cfg_->setString("metadata.source", "decoder");
    cfg_->setString("metadata.exiftool_path", "exiftool");

    cfg_->setInt("threading.max_hashing_threads", 4);
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
    std::vector<std::string> tokens;
    std::stringstream ss(str);
    std::string token;

    while (std::getline(ss, token, delimiter))
    {
        token = RecordKeys::trim(token);
        if (!token.empty())
            tokens.push_back(token);
    }

    return tokens;
}
