#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * @brief Run configuration backed by a Poco JSONConfiguration
 *
 * Defaults are installed at construction. load() replaces the whole
 * configuration from a JSON file; typed getters fall back to the defaults
 * for keys the file does not set.
 */
class PocoConfigManager
{
public:
    static PocoConfigManager &getInstance()
    {
        static PocoConfigManager instance;
        return instance;
    }

    // Core file operations
    bool load(const std::string &path);
    bool save(const std::string &path) const;
    void update(const nlohmann::json &patch);
    nlohmann::json getAll() const;
    void resetToDefaults();

    // Basic configuration getters
    std::string getString(const std::string &key, const std::string &def = "") const;
    int getInt(const std::string &key, int def = 0) const;
    bool getBool(const std::string &key, bool def = false) const;

    std::string getLogLevel() const;

    // Scan configuration
    std::string getScanRoot() const;
    std::vector<std::string> getImageExtensions() const;

    // Output configuration
    std::string getDatabasePath() const;
    std::string getOutputDirectory() const;

    // External record configuration
    std::string getRecordsPath() const;
    std::string getRecordIdColumn() const;
    std::string getAccessionColumn() const;
    std::string getInventoryColumn() const;
    std::string getSuffixColumn() const;

    // Linkage configuration
    std::string getPathLayout() const;
    std::string getFilenamePattern() const;
    std::vector<std::string> getUnlinkedMarkers() const;

    bool getIncludeAverageHash() const;

    // Metadata configuration
    std::string getMetadataSource() const;
    std::string getExifToolPath() const;

    int getMaxHashingThreads() const;

    // Configuration validation
    bool validateConfig() const;

    bool hasKey(const std::string &key) const;

private:
    PocoConfigManager();
    ~PocoConfigManager() = default;
    PocoConfigManager(const PocoConfigManager &) = delete;
    PocoConfigManager &operator=(const PocoConfigManager &) = delete;

    void initializeDefaultConfig();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};

// Helper function to split strings by delimiter, trimming and dropping empty tokens
std::vector<std::string> split(const std::string &str, char delimiter);
