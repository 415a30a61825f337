#include "config.hpp"
#include "errors.hpp"
#include "ranking.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

std::string Config::getConfigPath() {
    const char* home = getenv("HOME");
    if (!home) {
        throw std::runtime_error("Could not determine home directory");
    }

    return (fs::path(home) / ".subscout" / "config.json").string();
}

void Config::ensureConfigDirectory(const std::string& path) {
    fs::path config_dir = fs::path(path).parent_path();
    if (!config_dir.empty() && !fs::exists(config_dir)) {
        fs::create_directories(config_dir);
    }
}

Config Config::load(const std::string& path) {
    ensureConfigDirectory(path);

    std::ifstream file(path);
    if (!file.is_open()) {
        Config default_config;
        const char* home = getenv("HOME");
        if (home) {
            default_config.cache_dir = (fs::path(home) / ".subscout" / "cache").string();
        }

        default_config.save(path);
        return default_config;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        throw SubscoutError("Failed to parse config " + path + ": " + e.what());
    }
    return fromJson(j);
}

void Config::save(const std::string& path) const {
    ensureConfigDirectory(path);

    std::ofstream file(path);
    if (!file.is_open()) {
        throw SubscoutError("Failed to write config " + path);
    }
    file << toJson().dump(4);
}

Config Config::fromJson(const nlohmann::json& j) {
    Config defaults;
    Config config;
    try {
        config.languages = j.value("languages", defaults.languages);
        config.providers = j.value("providers", defaults.providers);
        config.workers = j.value("workers", defaults.workers);
        config.multi = j.value("multi", defaults.multi);
        config.force = j.value("force", defaults.force);
        config.max_depth = j.value("max_depth", defaults.max_depth);
        config.sort_order = j.value("sort_order", defaults.sort_order);
        config.cache_dir = j.value("cache_dir", defaults.cache_dir);
        config.filemode = j.value("filemode", defaults.filemode);
        config.opensubtitles_api_key = j.value("opensubtitles_api_key", defaults.opensubtitles_api_key);
        config.opensubtitles_username = j.value("opensubtitles_username", defaults.opensubtitles_username);
        config.opensubtitles_password = j.value("opensubtitles_password", defaults.opensubtitles_password);
    } catch (const nlohmann::json::exception& e) {
        throw SubscoutError(std::string("Invalid config: ") + e.what());
    }
    return config;
}

nlohmann::json Config::toJson() const {
    nlohmann::json j;
    j["languages"] = languages;
    j["providers"] = providers;
    j["workers"] = workers;
    j["multi"] = multi;
    j["force"] = force;
    j["max_depth"] = max_depth;
    j["sort_order"] = sort_order;
    j["cache_dir"] = cache_dir;
    j["filemode"] = filemode;
    j["opensubtitles_api_key"] = opensubtitles_api_key;
    j["opensubtitles_username"] = opensubtitles_username;
    j["opensubtitles_password"] = opensubtitles_password;
    return j;
}

SchedulerOptions Config::toSchedulerOptions() const {
    if (workers < 1) {
        throw SubscoutError("workers must be at least 1");
    }
    if (max_depth < 0) {
        throw SubscoutError("max_depth must not be negative");
    }

    SchedulerOptions options;
    options.languages = languages;
    options.providers = providers;
    options.workers = static_cast<size_t>(workers);
    options.multi = multi;
    options.force = force;
    options.max_depth = max_depth;
    for (const auto& name : sort_order) {
        options.sort_order.push_back(ranking::parseCriterion(name));
    }
    options.cache_dir = cache_dir;
    if (!filemode.empty()) {
        try {
            size_t used = 0;
            unsigned long mode = std::stoul(filemode, &used, 8);
            if (used != filemode.size() || mode > 07777) {
                throw SubscoutError("Invalid filemode: " + filemode);
            }
            options.filemode = static_cast<unsigned>(mode);
        } catch (const std::logic_error&) {
            throw SubscoutError("Invalid filemode: " + filemode);
        }
    }
    options.api_key = opensubtitles_api_key;
    options.username = opensubtitles_username;
    options.password = opensubtitles_password;
    return options;
}
