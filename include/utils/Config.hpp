#pragma once
#include <string>

namespace Pequod {

// Settings from ~/.config/pequod/config.json. Command line overrides are
// applied through the setters and are not written back.
class Config {
public:
    static Config& getInstance();

    // Use another file instead of the XDG location. Call before load().
    void setConfigPath(const std::string& path);
    std::string getConfigPath() const;

    // Reads the file, creating it with defaults when missing. Returns false
    // when an existing file could not be parsed; defaults apply then.
    bool load();
    bool save() const;

    // $XDG_DATA_HOME/pequod or ~/.local/share/pequod.
    static std::string getDataDir();
    // mkdir -p
    static bool ensureDirectory(const std::string& path);

    std::string getDbPath() const;
    void setDbPath(const std::string& path);
    int getMaxTtlDays() const { return maxTtlDays_; }
    void setMaxTtlDays(int days);

    int getSyncConcurrency() const { return syncConcurrency_; }
    int getFeedTimeoutSeconds() const { return feedTimeoutSeconds_; }
    int getContentTimeoutSeconds() const { return contentTimeoutSeconds_; }
    std::string getUserAgent() const { return userAgent_; }

    std::string getLogLevel() const { return logLevel_; }
    void setLogLevel(const std::string& level) { logLevel_ = level; }
    std::string getLogPath() const;

private:
    Config();
    ~Config() = default;
    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    void ensureDefaults();

    std::string configPath_;
    std::string dbPath_;
    int maxTtlDays_;
    int syncConcurrency_;
    int feedTimeoutSeconds_;
    int contentTimeoutSeconds_;
    std::string userAgent_;
    std::string logLevel_;
};

}
