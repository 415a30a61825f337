#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "scheduler.hpp"

struct Config {
    std::vector<std::string> languages;
    std::vector<std::string> providers;
    int workers = 4;
    bool multi = false;
    bool force = false;
    int max_depth = 3;
    std::vector<std::string> sort_order = {"language", "provider", "provider_confidence"};
    std::string cache_dir;
    // Octal permission bits such as "644", empty to leave downloaded files alone.
    std::string filemode;
    std::string opensubtitles_api_key;
    std::string opensubtitles_username;
    std::string opensubtitles_password;

    static Config load(const std::string& path);
    void save(const std::string& path) const;

    static Config fromJson(const nlohmann::json& j);
    nlohmann::json toJson() const;

    // Throws SubscoutError on an invalid sort criterion, worker count or file mode.
    SchedulerOptions toSchedulerOptions() const;

    static std::string getConfigPath();
    static void ensureConfigDirectory(const std::string& path);
};
