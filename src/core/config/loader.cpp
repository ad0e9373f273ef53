#include <healthstream/core/config/loader.hpp>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace HealthStream {

namespace {

constexpr long MAX_DURATION_SECONDS = 999999999999L;

std::optional<long> parseInteger(const std::string& text) {
    if (text.empty()) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0') {
        return std::nullopt;
    }
    return v;
}

// Integer setting that must fit an int and be at least min_value
std::optional<int> parseIntSetting(const std::string& text, long min_value) {
    auto v = parseInteger(text);
    if (!v || *v < min_value || *v > std::numeric_limits<int>::max()) {
        return std::nullopt;
    }
    return static_cast<int>(*v);
}

std::optional<bool> parseBool(const std::string& text) {
    if (text == "1" || text == "t" || text == "T" || text == "true" || text == "TRUE" || text == "True") {
        return true;
    }
    if (text == "0" || text == "f" || text == "F" || text == "false" || text == "FALSE" || text == "False") {
        return false;
    }
    return std::nullopt;
}

// Scalar lookup; a value of the wrong type keeps the default and warns
template<typename T>
void readField(const YAML::Node& parent, const char* key, T& out, const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node) return;
    try {
        out = node.as<T>();
    } catch (const YAML::BadConversion&) {
        spdlog::warn("[ConfigLoader] Invalid value for {}.{}, keeping default", path, key);
    }
}

void readDuration(const YAML::Node& parent, const char* key, std::chrono::milliseconds& out,
                  const std::string& path) {
    const YAML::Node node = parent[key];
    if (!node) return;

    std::string text;
    try {
        text = node.as<std::string>();
    } catch (const YAML::BadConversion&) {
        spdlog::warn("[ConfigLoader] Invalid duration for {}.{}, keeping default", path, key);
        return;
    }

    // bare numbers are seconds
    if (auto secs = parseInteger(text)) {
        if (*secs > 0 && *secs <= MAX_DURATION_SECONDS) {
            out = std::chrono::seconds(*secs);
            return;
        }
    } else if (auto d = ConfigLoader::parseDuration(text)) {
        out = *d;
        return;
    }
    spdlog::warn("[ConfigLoader] Invalid duration '{}' for {}.{}, keeping default", text, path, key);
}

const char* envValue(const char* name) {
    const char* v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

} // namespace

std::optional<std::chrono::milliseconds> ConfigLoader::parseDuration(const std::string& text) {
    size_t pos = 0;
    while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
        ++pos;
    }
    if (pos == 0 || pos > 12) return std::nullopt;

    const long long amount = std::stoll(text.substr(0, pos));
    const std::string unit = text.substr(pos);
    if (amount <= 0) return std::nullopt;

    if (unit == "ms") return std::chrono::milliseconds(amount);
    if (unit == "s") return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(amount));
    if (unit == "m") return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::minutes(amount));
    if (unit == "h") return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::hours(amount));
    return std::nullopt;
}

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    std::ifstream probe(filepath);
    if (!probe.good()) {
        throw std::runtime_error("Config file not found: " + filepath);
    }

    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to parse config file " + filepath + ": " + e.what());
    }
    if (!root.IsMap()) {
        throw std::runtime_error("Config file " + filepath + " is not a YAML mapping");
    }

    AppConfig::AppConfiguration config;
    readField(root, "app_name", config.app_name, "root");
    readField(root, "version", config.version, "root");
    readField(root, "identity", config.identity, "root");

    int sample_rate = config.sample_rate_seconds;
    readField(root, "sample_rate_seconds", sample_rate, "root");
    if (sample_rate > 0) {
        config.sample_rate_seconds = sample_rate;
    } else {
        spdlog::warn("[ConfigLoader] sample_rate_seconds must be positive, keeping {}", config.sample_rate_seconds);
    }

    if (const YAML::Node p = root["persistence"]) {
        readField(p, "enabled", config.persistence.enabled, "persistence");
        readField(p, "db_path", config.persistence.db_path, "persistence");
        readDuration(p, "flush_interval", config.persistence.flush_interval, "persistence");

        long batch = static_cast<long>(config.persistence.batch_size);
        readField(p, "batch_size", batch, "persistence");
        if (batch > 0) {
            config.persistence.batch_size = static_cast<size_t>(batch);
        } else {
            spdlog::warn("[ConfigLoader] persistence.batch_size must be positive, keeping {}",
                         config.persistence.batch_size);
        }
    }

    if (const YAML::Node b = root["backup"]) {
        readField(b, "enabled", config.backup.enabled, "backup");
        readField(b, "backup_dir", config.backup.backup_dir, "backup");

        int retention = config.backup.retention_days;
        readField(b, "retention_days", retention, "backup");
        if (retention >= 0) {
            config.backup.retention_days = retention;
        } else {
            spdlog::warn("[ConfigLoader] backup.retention_days must not be negative, keeping {}",
                         config.backup.retention_days);
        }
    }

    if (const YAML::Node l = root["logging"]) {
        readField(l, "level", config.logging.level, "logging");
    }

    spdlog::info("[ConfigLoader] Loaded {} v{} from {}", config.app_name, config.version, filepath);
    return config;
}

void ConfigLoader::applyEnvironment(AppConfig::AppConfiguration& config) {
    if (const char* v = envValue("HEALTH_SAMPLE_RATE")) {
        if (auto n = parseIntSetting(v, 1)) {
            config.sample_rate_seconds = *n;
        } else {
            spdlog::warn("[ConfigLoader] Ignoring HEALTH_SAMPLE_RATE='{}'", v);
        }
    }
    if (const char* v = envValue("HEALTH_PERSISTENCE_ENABLED")) {
        if (auto b = parseBool(v)) config.persistence.enabled = *b;
    }
    if (const char* v = envValue("HEALTH_DB_PATH")) {
        config.persistence.db_path = v;
    }
    if (const char* v = envValue("HEALTH_FLUSH_INTERVAL")) {
        if (auto d = parseDuration(v)) config.persistence.flush_interval = *d;
    }
    if (const char* v = envValue("HEALTH_BATCH_SIZE")) {
        auto n = parseInteger(v);
        if (n && *n > 0) config.persistence.batch_size = static_cast<size_t>(*n);
    }
    if (const char* v = envValue("HEALTH_BACKUP_ENABLED")) {
        if (auto b = parseBool(v)) config.backup.enabled = *b;
    }
    if (const char* v = envValue("HEALTH_BACKUP_DIR")) {
        config.backup.backup_dir = v;
    }
    if (const char* v = envValue("HEALTH_BACKUP_RETENTION_DAYS")) {
        if (auto n = parseIntSetting(v, 0)) {
            config.backup.retention_days = *n;
        } else {
            spdlog::warn("[ConfigLoader] Ignoring HEALTH_BACKUP_RETENTION_DAYS='{}'", v);
        }
    }
}

} // namespace HealthStream
