#include "opensubtitles.hpp"
#include "download_utils.hpp"
#include "errors.hpp"
#include "languages.hpp"
#include "logging.hpp"
#include "utils.hpp"
#include <cinttypes>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {
    const std::string API_URL = "https://api.opensubtitles.com/api/v1";
    const std::string LOGGER = "subscout.opensubtitles";
    const std::string TOKEN_KEY = "opensubtitles.token";
    const std::uintmax_t HASH_CHUNK_SIZE = 65536;

    bool readChunkSum(std::ifstream& file, std::uint64_t& sum) {
        unsigned char buffer[HASH_CHUNK_SIZE];
        if (!file.read(reinterpret_cast<char*>(buffer), HASH_CHUNK_SIZE)) {
            return false;
        }
        for (std::uintmax_t offset = 0; offset < HASH_CHUNK_SIZE; offset += 8) {
            std::uint64_t word = 0;
            for (int i = 7; i >= 0; --i) {
                word = (word << 8) | buffer[offset + i];
            }
            sum += word;
        }
        return true;
    }

    std::string normalizeLanguage(const std::string& language) {
        // pt-br, zh-cn, ... fold into their ISO 639-1 base code.
        auto parts = utils::splitString(language, '-');
        return utils::toLower(parts.empty() ? language : parts[0]);
    }
}

OpenSubtitles::OpenSubtitles(const ProviderConfig& config, Scratch& shared)
    : config_(config), shared_(shared) {}

std::set<std::string> OpenSubtitles::availableLanguages() {
    return {
        "af", "ar", "bg", "bn", "br", "bs", "ca", "cs", "da", "de", "el", "en", "eo", "es", "et", "eu",
        "fa", "fi", "fr", "gl", "he", "hi", "hr", "hu", "hy", "id", "is", "it", "ja", "ka", "kk", "km",
        "ko", "lb", "lt", "lv", "mk", "ml", "mn", "ms", "my", "nl", "no", "oc", "pl", "pt", "ro", "ru",
        "si", "sk", "sl", "sq", "sr", "sv", "sw", "ta", "te", "th", "tl", "tr", "uk", "ur", "uz", "vi",
        "zh"
    };
}

bool OpenSubtitles::isValidVideo(const Video& video) {
    if (video.exists()) {
        return true;
    }
    return video.kind == Video::Kind::Episode ? !video.series.empty() : !video.title.empty();
}

std::string OpenSubtitles::hashFile(const std::string& path) {
    std::error_code ec;
    std::uintmax_t size = fs::file_size(path, ec);
    if (ec || size < HASH_CHUNK_SIZE * 2) {
        return "";
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return "";
    }

    std::uint64_t hash = size;
    if (!readChunkSum(file, hash)) {
        return "";
    }
    file.seekg(static_cast<std::streamoff>(size - HASH_CHUNK_SIZE), std::ios::beg);
    if (!readChunkSum(file, hash)) {
        return "";
    }

    char formatted[17];
    std::snprintf(formatted, sizeof(formatted), "%016" PRIx64, hash);
    return formatted;
}

std::string OpenSubtitles::buildSearchQuery(const Video& video, const std::set<std::string>& languages,
                                            const std::string& hash) {
    // The API asks for alphabetically ordered parameters.
    std::vector<std::string> params;
    std::vector<std::string> codes(languages.begin(), languages.end());

    if (video.kind == Video::Kind::Episode) {
        params.push_back("episode_number=" + std::to_string(video.episode));
    }
    params.push_back("languages=" + utils::joinStrings(codes, ","));
    if (!hash.empty()) {
        params.push_back("moviehash=" + hash);
    }
    std::string query = video.kind == Video::Kind::Episode ? video.series : video.title;
    params.push_back("query=" + urlEscape(utils::toLower(query)));
    if (video.kind == Video::Kind::Episode) {
        params.push_back("season_number=" + std::to_string(video.season));
        params.push_back("type=episode");
    } else {
        params.push_back("type=movie");
        if (video.year) {
            params.push_back("year=" + std::to_string(*video.year));
        }
    }
    return "/subtitles?" + utils::joinStrings(params, "&");
}

std::vector<Subtitle> OpenSubtitles::parseSearchResponse(const nlohmann::json& json, const VideoPtr& video,
                                                         const std::set<std::string>& languages, bool multi) {
    if (!json.contains("data") || !json["data"].is_array()) {
        throw PluginError("OpenSubtitles: missing data in search response");
    }

    std::vector<Subtitle> subtitles;
    for (const auto& item : json["data"]) {
        if (!item.contains("attributes") || item["attributes"].is_null()) {
            continue;
        }
        const auto& attributes = item["attributes"];
        if (!attributes.contains("language") || !attributes["language"].is_string()) {
            continue;
        }
        if (!attributes.contains("files") || !attributes["files"].is_array() || attributes["files"].empty()) {
            continue;
        }

        std::string language = normalizeLanguage(attributes["language"].get<std::string>());
        if (!languages::isValid(language) || !languages.count(language)) {
            continue;
        }

        Subtitle subtitle;
        subtitle.video = video;
        subtitle.provider = NAME;
        subtitle.language = language;
        subtitle.link = std::to_string(attributes["files"][0]["file_id"].get<std::int64_t>());
        if (attributes.contains("release") && attributes["release"].is_string()) {
            subtitle.release = attributes["release"].get<std::string>();
        }
        bool hash_match = attributes.contains("moviehash_match") && attributes["moviehash_match"].is_boolean() &&
                          attributes["moviehash_match"].get<bool>();
        subtitle.confidence = hash_match ? 1.0 : 0.5;
        subtitle.path = providers::subtitlePath(*video, language, multi);
        subtitles.push_back(subtitle);
    }
    return subtitles;
}

std::vector<Subtitle> OpenSubtitles::list(const VideoPtr& video, const std::set<std::string>& languages) {
    std::string hash = video->exists() ? hashFile(video->path) : "";
    std::string endpoint = buildSearchQuery(*video, languages, hash);
    logging::debug(LOGGER, "Searching " + endpoint);

    HttpResponse response;
    try {
        response = httpGet(API_URL + endpoint, headers(false));
    } catch (const std::runtime_error& e) {
        throw PluginError(std::string("OpenSubtitles: ") + e.what());
    }

    if (response.status == 401 || response.status == 403) {
        throw PluginError("OpenSubtitles: Unauthorized, check the API key");
    } else if (response.status != 200) {
        throw PluginError("OpenSubtitles: Server returned HTTP code " + std::to_string(response.status));
    }

    try {
        return parseSearchResponse(nlohmann::json::parse(response.body), video, languages, config_.multi);
    } catch (const nlohmann::json::exception& e) {
        throw PluginError(std::string("OpenSubtitles: Failed to parse search response: ") + e.what());
    }
}

Subtitle OpenSubtitles::download(const Subtitle& subtitle) {
    size_t used = 0;
    long long file_id = 0;
    try {
        file_id = std::stoll(subtitle.link, &used);
    } catch (const std::logic_error&) {
        used = 0;
    }
    if (used == 0 || used != subtitle.link.size()) {
        throw DownloadFailedError("OpenSubtitles: Invalid file id '" + subtitle.link + "'");
    }

    nlohmann::json body;
    body["file_id"] = file_id;

    HttpResponse response = requestDownload(body);
    if ((response.status == 401 || response.status == 403) && !config_.username.empty()) {
        // The stored login token has expired or was revoked.
        logging::info(LOGGER, "Download refused with HTTP code " + std::to_string(response.status) +
                              ", logging in again");
        invalidateToken();
        response = requestDownload(body);
    }

    if (response.status != 200) {
        throw DownloadFailedError("OpenSubtitles: Server returned HTTP code " + std::to_string(response.status));
    }

    std::string link;
    try {
        auto json = nlohmann::json::parse(response.body);
        link = json.at("link").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        throw DownloadFailedError(std::string("OpenSubtitles: Failed to parse download response: ") + e.what());
    }

    try {
        httpDownloadFile(link, subtitle.path);
    } catch (const std::runtime_error& e) {
        throw DownloadFailedError(std::string("OpenSubtitles: ") + e.what());
    }

    providers::applyFileMode(subtitle.path, config_);
    logging::info(LOGGER, "Downloaded " + subtitle.path);
    return subtitle;
}

HttpResponse OpenSubtitles::requestDownload(const nlohmann::json& body) {
    try {
        return httpPost(API_URL + "/download", body.dump(), headers(true));
    } catch (const std::runtime_error& e) {
        throw DownloadFailedError(std::string("OpenSubtitles: ") + e.what());
    }
}

std::vector<std::string> OpenSubtitles::headers(bool authorized) {
    if (config_.api_key.empty()) {
        throw PluginError("OpenSubtitles: No API key configured");
    }

    std::vector<std::string> result = {
        "Api-Key: " + config_.api_key,
        "Accept: application/json",
        "Content-Type: application/json"
    };
    if (authorized) {
        std::string bearer = token();
        if (!bearer.empty()) {
            result.push_back("Authorization: Bearer " + bearer);
        }
    }
    return result;
}

std::string OpenSubtitles::token() {
    if (config_.username.empty()) {
        return "";
    }

    auto cached = shared_.find(TOKEN_KEY);
    if (cached != shared_.end()) {
        return cached->second;
    }

    std::string cache_path = tokenCachePath();
    if (!cache_path.empty()) {
        std::ifstream file(cache_path);
        std::string stored;
        if (file.is_open() && std::getline(file, stored) && !stored.empty()) {
            shared_[TOKEN_KEY] = stored;
            return stored;
        }
    }

    nlohmann::json body;
    body["username"] = config_.username;
    body["password"] = config_.password;

    HttpResponse response;
    try {
        response = httpPost(API_URL + "/login", body.dump(),
                            {"Api-Key: " + config_.api_key, "Accept: application/json",
                             "Content-Type: application/json"});
    } catch (const std::runtime_error& e) {
        logging::warning(LOGGER, std::string("Login failed, downloading anonymously: ") + e.what());
        return "";
    }

    if (response.status != 200) {
        logging::warning(LOGGER, "Login failed with HTTP code " + std::to_string(response.status) +
                                 ", downloading anonymously");
        return "";
    }

    std::string value;
    try {
        value = nlohmann::json::parse(response.body).at("token").get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        logging::warning(LOGGER, std::string("Unexpected login response: ") + e.what());
        return "";
    }

    shared_[TOKEN_KEY] = value;
    if (!cache_path.empty()) {
        std::ofstream file(cache_path);
        file << value << "\n";
    }
    return value;
}

void OpenSubtitles::invalidateToken() {
    shared_.erase(TOKEN_KEY);
    std::string cache_path = tokenCachePath();
    if (cache_path.empty()) {
        return;
    }
    std::error_code ec;
    fs::remove(cache_path, ec);
    if (ec) {
        logging::warning(LOGGER, "Could not remove " + cache_path + ": " + ec.message());
    }
}

std::string OpenSubtitles::tokenCachePath() const {
    if (config_.cache_dir.empty()) {
        return "";
    }
    return (fs::path(config_.cache_dir) / "opensubtitles.token").string();
}
