#pragma once
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "subtitle.hpp"
#include "video.hpp"

// Per-worker key-value store handed to providers so they can reuse sessions
// across calls made by the same worker. Never shared between workers.
using Scratch = std::map<std::string, std::string>;

struct ProviderConfig {
    bool multi = false;
    std::string cache_dir;
    std::optional<unsigned> filemode;
    std::string api_key;
    std::string username;
    std::string password;
};

class Provider {
public:
    virtual ~Provider() = default;

    // Throws PluginError on provider specific faults.
    virtual std::vector<Subtitle> list(const VideoPtr& video, const std::set<std::string>& languages) = 0;

    // Fetches `subtitle` to its target path and returns it.
    // Throws DownloadFailedError when this subtitle could not be fetched.
    virtual Subtitle download(const Subtitle& subtitle) = 0;
};

struct ProviderEntry {
    using Factory = std::function<std::unique_ptr<Provider>(const ProviderConfig&, Scratch&)>;

    std::string name;
    bool api_based = false;
    std::set<std::string> languages;
    std::function<bool(const Video&)> is_valid_video;
    Factory create;
};

class ProviderRegistry {
public:
    void add(ProviderEntry entry);

    bool contains(const std::string& name) const;

    // Throws PluginError for unknown names.
    const ProviderEntry& get(const std::string& name) const;

    std::vector<std::string> names() const;
    std::vector<std::string> apiBasedNames() const;

    // Deduplicates `names` keeping the first occurrence of each.
    // Throws PluginError on the first unknown name.
    std::vector<std::string> validate(const std::vector<std::string>& names) const;

    static const ProviderRegistry& builtin();

private:
    std::vector<ProviderEntry> entries_;
};

namespace providers {
    // <base>.<language>.srt in multi mode, <base>.srt otherwise.
    std::string subtitlePath(const Video& video, const std::string& language, bool multi);

    void applyFileMode(const std::string& path, const ProviderConfig& config);
}
