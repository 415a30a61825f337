#pragma once
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "download_utils.hpp"
#include "provider.hpp"

// OpenSubtitles REST API (v1). Requires an API key; a username/password
// pair raises the download quota.
class OpenSubtitles : public Provider {
public:
    static constexpr const char* NAME = "OpenSubtitles";

    OpenSubtitles(const ProviderConfig& config, Scratch& shared);

    static std::set<std::string> availableLanguages();
    static bool isValidVideo(const Video& video);

    std::vector<Subtitle> list(const VideoPtr& video, const std::set<std::string>& languages) override;
    Subtitle download(const Subtitle& subtitle) override;

    // OpenSubtitles hash: file size plus the 64-bit little-endian word sums of the
    // first and last 64 KiB, as 16 hex digits. Empty when the file is too small or unreadable.
    static std::string hashFile(const std::string& path);

    static std::string buildSearchQuery(const Video& video, const std::set<std::string>& languages,
                                        const std::string& hash);

    static std::vector<Subtitle> parseSearchResponse(const nlohmann::json& json, const VideoPtr& video,
                                                     const std::set<std::string>& languages, bool multi);

    // Forgets the login token, in memory and in the cache directory.
    void invalidateToken();
    std::string tokenCachePath() const;

private:
    ProviderConfig config_;
    Scratch& shared_;

    std::vector<std::string> headers(bool authorized);
    std::string token();
    HttpResponse requestDownload(const nlohmann::json& body);
};
