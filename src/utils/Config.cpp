#include "utils/Config.hpp"
#include <json-glib/json-glib.h>
#include <spdlog/spdlog.h>
#include <sys/stat.h>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace Pequod {

namespace {

const int kDefaultMaxTtlDays = 5;
const int kDefaultConcurrency = 4;
const int kDefaultFeedTimeout = 15;
const int kDefaultContentTimeout = 20;
const char* kDefaultUserAgent = "pequod/1.0 (+https://github.com/pequod-reader)";

std::string homeDir() {
    const char* home = getenv("HOME");
    return home ? home : ".";
}

JsonObject* section(JsonObject* root, const char* name) {
    if (!json_object_has_member(root, name)) return nullptr;
    JsonNode* node = json_object_get_member(root, name);
    return JSON_NODE_HOLDS_OBJECT(node) ? json_node_get_object(node) : nullptr;
}

int readInt(JsonObject* obj, const char* name, int fallback) {
    if (!obj || !json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_INT64) {
        spdlog::warn("Config: {} is not an integer, using {}", name, fallback);
        return fallback;
    }
    gint64 value = json_node_get_int(node);
    if (value < 1 || value > INT_MAX) {
        spdlog::warn("Config: {} must be between 1 and {}, using {}", name, INT_MAX, fallback);
        return fallback;
    }
    return static_cast<int>(value);
}

std::string readString(JsonObject* obj, const char* name, const std::string& fallback) {
    if (!obj || !json_object_has_member(obj, name)) return fallback;
    JsonNode* node = json_object_get_member(obj, name);
    if (!JSON_NODE_HOLDS_VALUE(node) || json_node_get_value_type(node) != G_TYPE_STRING) return fallback;
    const char* value = json_node_get_string(node);
    return value ? value : fallback;
}

}

Config& Config::getInstance() {
    static Config instance;
    return instance;
}

Config::Config() {
    ensureDefaults();
}

void Config::ensureDefaults() {
    dbPath_.clear();
    maxTtlDays_ = kDefaultMaxTtlDays;
    syncConcurrency_ = kDefaultConcurrency;
    feedTimeoutSeconds_ = kDefaultFeedTimeout;
    contentTimeoutSeconds_ = kDefaultContentTimeout;
    userAgent_ = kDefaultUserAgent;
    logLevel_ = "info";
}

void Config::setConfigPath(const std::string& path) {
    configPath_ = path;
}

std::string Config::getConfigPath() const {
    if (!configPath_.empty()) return configPath_;
    const char* xdg = getenv("XDG_CONFIG_HOME");
    std::string base = (xdg && *xdg) ? xdg : homeDir() + "/.config";
    return base + "/pequod/config.json";
}

std::string Config::getDataDir() {
    const char* xdg = getenv("XDG_DATA_HOME");
    std::string base = (xdg && *xdg) ? xdg : homeDir() + "/.local/share";
    return base + "/pequod";
}

bool Config::ensureDirectory(const std::string& path) {
    if (path.empty()) return false;
    for (size_t pos = path.find('/', 1); ; pos = path.find('/', pos + 1)) {
        std::string dir = path.substr(0, pos);
        if (mkdir(dir.c_str(), 0755) != 0 && errno != EEXIST) return false;
        if (pos == std::string::npos) break;
    }
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

std::string Config::getDbPath() const {
    return dbPath_.empty() ? getDataDir() + "/pequod.db" : dbPath_;
}

void Config::setDbPath(const std::string& path) {
    dbPath_ = path;
}

void Config::setMaxTtlDays(int days) {
    if (days > 0) maxTtlDays_ = days;
}

std::string Config::getLogPath() const {
    return getDataDir() + "/pequod.log";
}

bool Config::load() {
    ensureDefaults();
    std::string configPath = getConfigPath();
    ensureDirectory(configPath.substr(0, configPath.rfind('/')));

    struct stat st;
    if (stat(configPath.c_str(), &st) != 0) {
        save();
        return true;
    }

    JsonParser* parser = json_parser_new();
    GError* error = nullptr;
    if (!json_parser_load_from_file(parser, configPath.c_str(), &error)) {
        spdlog::warn("Config: cannot parse {}: {}", configPath, error ? error->message : "unknown error");
        if (error) g_error_free(error);
        g_object_unref(parser);
        return false;
    }

    JsonNode* root = json_parser_get_root(parser);
    if (!root || !JSON_NODE_HOLDS_OBJECT(root)) {
        spdlog::warn("Config: {} does not hold an object", configPath);
        g_object_unref(parser);
        return false;
    }

    JsonObject* obj = json_node_get_object(root);

    JsonObject* storage = section(obj, "storage");
    dbPath_ = readString(storage, "db_path", "");
    maxTtlDays_ = readInt(storage, "max_ttl_days", kDefaultMaxTtlDays);

    JsonObject* sync = section(obj, "sync");
    syncConcurrency_ = readInt(sync, "concurrency", kDefaultConcurrency);
    feedTimeoutSeconds_ = readInt(sync, "feed_timeout_seconds", kDefaultFeedTimeout);

    JsonObject* content = section(obj, "content");
    contentTimeoutSeconds_ = readInt(content, "timeout_seconds", kDefaultContentTimeout);

    userAgent_ = readString(section(obj, "http"), "user_agent", kDefaultUserAgent);
    logLevel_ = readString(section(obj, "log"), "level", "info");

    g_object_unref(parser);
    return true;
}

bool Config::save() const {
    JsonBuilder* builder = json_builder_new();
    json_builder_begin_object(builder);

    json_builder_set_member_name(builder, "storage");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "db_path");
    json_builder_add_string_value(builder, dbPath_.c_str());
    json_builder_set_member_name(builder, "max_ttl_days");
    json_builder_add_int_value(builder, maxTtlDays_);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "sync");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "concurrency");
    json_builder_add_int_value(builder, syncConcurrency_);
    json_builder_set_member_name(builder, "feed_timeout_seconds");
    json_builder_add_int_value(builder, feedTimeoutSeconds_);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "content");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "timeout_seconds");
    json_builder_add_int_value(builder, contentTimeoutSeconds_);
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "http");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "user_agent");
    json_builder_add_string_value(builder, userAgent_.c_str());
    json_builder_end_object(builder);

    json_builder_set_member_name(builder, "log");
    json_builder_begin_object(builder);
    json_builder_set_member_name(builder, "level");
    json_builder_add_string_value(builder, logLevel_.c_str());
    json_builder_end_object(builder);

    json_builder_end_object(builder);

    JsonGenerator* gen = json_generator_new();
    json_generator_set_pretty(gen, TRUE);
    JsonNode* rootNode = json_builder_get_root(builder);
    json_generator_set_root(gen, rootNode);

    GError* error = nullptr;
    bool ok = json_generator_to_file(gen, getConfigPath().c_str(), &error);
    if (error) {
        spdlog::warn("Config: cannot write {}: {}", getConfigPath(), error->message);
        g_error_free(error);
    }

    json_node_unref(rootNode);
    g_object_unref(gen);
    g_object_unref(builder);
    return ok;
}

}
