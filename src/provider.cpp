#include "provider.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "opensubtitles.hpp"
#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

void ProviderRegistry::add(ProviderEntry entry) {
    if (contains(entry.name)) {
        throw PluginError("Provider already registered: " + entry.name);
    }
    entries_.push_back(std::move(entry));
}

bool ProviderRegistry::contains(const std::string& name) const {
    return std::any_of(entries_.begin(), entries_.end(),
                       [&name](const ProviderEntry& entry) { return entry.name == name; });
}

const ProviderEntry& ProviderRegistry::get(const std::string& name) const {
    for (const auto& entry : entries_) {
        if (entry.name == name) {
            return entry;
        }
    }
    throw PluginError("Unknown provider: " + name);
}

std::vector<std::string> ProviderRegistry::names() const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        result.push_back(entry.name);
    }
    return result;
}

std::vector<std::string> ProviderRegistry::apiBasedNames() const {
    std::vector<std::string> result;
    for (const auto& entry : entries_) {
        if (entry.api_based) {
            result.push_back(entry.name);
        }
    }
    return result;
}

std::vector<std::string> ProviderRegistry::validate(const std::vector<std::string>& names) const {
    std::vector<std::string> result;
    for (const auto& name : names) {
        if (!contains(name)) {
            throw PluginError("Unknown provider: " + name);
        }
        if (std::find(result.begin(), result.end(), name) == result.end()) {
            result.push_back(name);
        }
    }
    return result;
}

const ProviderRegistry& ProviderRegistry::builtin() {
    static const ProviderRegistry registry = [] {
        ProviderRegistry r;
        r.add(ProviderEntry{
            OpenSubtitles::NAME,
            true,
            OpenSubtitles::availableLanguages(),
            &OpenSubtitles::isValidVideo,
            [](const ProviderConfig& config, Scratch& shared) -> std::unique_ptr<Provider> {
                return std::make_unique<OpenSubtitles>(config, shared);
            }
        });
        return r;
    }();
    return registry;
}

namespace providers {

std::string subtitlePath(const Video& video, const std::string& language, bool multi) {
    if (multi) {
        return video.basePath() + "." + language + ".srt";
    }
    return video.basePath() + ".srt";
}

void applyFileMode(const std::string& path, const ProviderConfig& config) {
    if (!config.filemode) {
        return;
    }
    std::error_code ec;
    fs::permissions(path, static_cast<fs::perms>(*config.filemode), fs::perm_options::replace, ec);
    if (ec) {
        logging::warning("subscout", "Could not set mode of " + path + ": " + ec.message());
    }
}

}
