#include "scheduler.hpp"
#include "errors.hpp"
#include "languages.hpp"
#include "logging.hpp"
#include "scanner.hpp"
#include "utils.hpp"
#include <algorithm>
#include <filesystem>
#include <iterator>

namespace fs = std::filesystem;

namespace {
    const std::string LOGGER = "subscout";

    std::string describeList(const std::vector<std::string>& values) {
        return "[" + utils::joinStrings(values, ", ") + "]";
    }
}

Scheduler::Scheduler(const SchedulerOptions& options, const ProviderRegistry& registry)
    : registry_(registry),
      languages_(languages::validate(options.languages)),
      providers_(options.providers.empty() ? registry.apiBasedNames() : registry.validate(options.providers)),
      sort_order_(options.sort_order.empty() ? ranking::defaultCriteria() : options.sort_order),
      workers_(options.workers),
      multi_(options.multi),
      force_(options.force),
      max_depth_(options.max_depth),
      filemode_(options.filemode),
      api_key_(options.api_key),
      username_(options.username),
      password_(options.password) {
    if (workers_ == 0) {
        throw SubscoutError("At least one worker is required");
    }
    if (!options.cache_dir.empty()) {
        if (utils::createDirectoryIfNotExists(options.cache_dir)) {
            cache_dir_ = options.cache_dir;
            logging::debug(LOGGER, "Using cache directory " + cache_dir_);
        } else {
            logging::error(LOGGER, "Failed to use the cache directory, continue without it");
        }
    }
}

void Scheduler::setLanguages(const std::vector<std::string>& languages) {
    logging::debug(LOGGER, "Setting languages to " + describeList(languages));
    languages_ = languages::validate(languages);
}

void Scheduler::setProviders(const std::vector<std::string>& providers) {
    logging::debug(LOGGER, "Setting providers to " + describeList(providers));
    providers_ = registry_.validate(providers);
}

void Scheduler::setSortOrder(const std::vector<RankCriterion>& sort_order) {
    sort_order_ = sort_order.empty() ? ranking::defaultCriteria() : sort_order;
}

std::vector<std::pair<VideoPtr, std::vector<Subtitle>>> Scheduler::listSubtitles(
    const std::vector<std::string>& entries, bool auto_manage) {
    if (auto_manage) {
        requireIdle();
        start();
    }

    std::vector<std::pair<VideoPtr, std::vector<Subtitle>>> subtitles;
    size_t pending = 0;
    try {
        ProviderConfig config = providerConfig();

        std::vector<ScanEntry> scanned;
        for (const auto& entry : entries) {
            std::error_code ec;
            if (!fs::exists(entry, ec)) {
                scanned.push_back(ScanEntry{entry, {}, false});
                continue;
            }
            auto found = scanner::scan(entry, max_depth_);
            scanned.insert(scanned.end(), found.begin(), found.end());
        }

        std::vector<std::string> wanted_list = wantedLanguages();
        std::set<std::string> wanted(wanted_list.begin(), wanted_list.end());

        for (const auto& entry : scanned) {
            std::set<std::string> needed = scanner::needsSearch(entry.languages, entry.has_single, wanted, multi_, force_);
            if (needed.empty()) {
                logging::debug(LOGGER, "No need to list subtitles for " + entry.path +
                                       ", existing subtitles already cover " + describeList(languages_));
                continue;
            }

            VideoPtr video = Video::fromPath(entry.path);
            logging::debug(LOGGER, "Listing subtitles for " + video->path + " (" + video->describe() + ") with " +
                                   describeList(providers_));
            for (const auto& name : providers_) {
                const ProviderEntry& provider = registry_.get(name);
                std::set<std::string> provider_languages;
                std::set_intersection(needed.begin(), needed.end(), provider.languages.begin(),
                                      provider.languages.end(),
                                      std::inserter(provider_languages, provider_languages.end()));
                if (provider_languages.empty()) {
                    continue;
                }
                if (!acceptsVideo(provider, *video)) {
                    continue;
                }
                queue_.push(TaskQueue::PRIORITY_NORMAL, ListTask{video, provider_languages, name, config});
                ++pending;
            }
        }

        for (; pending > 0; --pending) {
            ListResult result = list_results_.pop();
            subtitles.insert(subtitles.end(), result.begin(), result.end());
        }
    } catch (...) {
        discardResults(list_results_, pending);
        if (auto_manage) {
            stopAndDrain();
        }
        throw;
    }

    if (auto_manage) {
        stopAndDrain();
    }
    return subtitles;
}

std::vector<Subtitle> Scheduler::downloadSubtitles(const std::vector<std::string>& entries, bool auto_manage) {
    if (auto_manage) {
        requireIdle();
        start();
    }

    std::vector<Subtitle> downloaded;
    size_t pending = 0;
    try {
        auto listed = listSubtitles(entries, false);

        // Several providers report on the same video: merge them in first-seen order.
        std::vector<std::pair<VideoPtr, std::vector<Subtitle>>> by_video;
        for (auto& entry : listed) {
            const std::string& path = entry.first->path;
            auto it = std::find_if(by_video.begin(), by_video.end(),
                                   [&path](const auto& group) { return group.first->path == path; });
            if (it == by_video.end()) {
                by_video.push_back(std::move(entry));
            } else {
                it->second.insert(it->second.end(), entry.second.begin(), entry.second.end());
            }
        }

        std::vector<RankCriterion> criteria = ranking::effectiveCriteria(sort_order_, multi_);
        Ranker ranker(wantedLanguages(), providers_);

        for (const auto& [video, subtitles] : by_video) {
            if (subtitles.empty()) {
                logging::info(LOGGER, "No subtitles found for " + video->path);
                continue;
            }
            std::vector<Subtitle> ordered = ranker.rank(subtitles, *video, criteria);
            if (!multi_) {
                queue_.push(TaskQueue::PRIORITY_NORMAL, DownloadTask{ordered});
                ++pending;
                continue;
            }

            std::vector<std::string> seen;
            for (const auto& subtitle : ordered) {
                if (std::find(seen.begin(), seen.end(), subtitle.language) == seen.end()) {
                    seen.push_back(subtitle.language);
                }
            }
            for (const auto& language : seen) {
                DownloadTask task;
                std::copy_if(ordered.begin(), ordered.end(), std::back_inserter(task.subtitles),
                             [&language](const Subtitle& s) { return s.language == language; });
                queue_.push(TaskQueue::PRIORITY_NORMAL, std::move(task));
                ++pending;
            }
        }

        for (; pending > 0; --pending) {
            DownloadResult result = download_results_.pop();
            downloaded.insert(downloaded.end(), result.begin(), result.end());
        }
    } catch (...) {
        discardResults(download_results_, pending);
        if (auto_manage) {
            stopAndDrain();
        }
        throw;
    }

    if (auto_manage) {
        stopAndDrain();
    }
    return downloaded;
}

void Scheduler::submit(Task task) {
    if (std::holds_alternative<StopTask>(task)) {
        throw WrongTaskKindError();
    }
    logging::debug(LOGGER, "Submitting " + describeTask(task));
    queue_.push(TaskQueue::PRIORITY_NORMAL, std::move(task));
}

void Scheduler::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ == State::Running) {
        throw InvalidStateError(stateName(state_), stateName(State::Idle));
    }
    pool_ = std::make_unique<WorkerPool>(workers_, queue_, list_results_, download_results_, registry_,
                                         providerConfig());
    pool_->start();
    state_ = State::Running;
    logging::debug(LOGGER, "Started " + std::to_string(workers_) + " workers");
}

void Scheduler::stopAndDrain() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != State::Running) {
        throw InvalidStateError(stateName(state_), stateName(State::Running));
    }
    pool_->stop(TaskQueue::PRIORITY_DRAIN);
    pool_.reset();
    state_ = State::Idle;
    logging::debug(LOGGER, "Workers drained and stopped");
}

void Scheduler::pauseNow() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (state_ != State::Running) {
        throw InvalidStateError(stateName(state_), stateName(State::Running));
    }
    pool_->stop(TaskQueue::PRIORITY_INTERRUPT);
    pool_.reset();
    state_ = queue_.pendingWork() > 0 ? State::Paused : State::Idle;
    logging::debug(LOGGER, "Workers paused with " + std::to_string(queue_.pendingWork()) + " tasks left");
}

Scheduler::State Scheduler::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::string Scheduler::stateName(State state) {
    switch (state) {
        case State::Idle: return "idle";
        case State::Running: return "running";
        case State::Paused: return "paused";
    }
    return "unknown";
}

ListResult Scheduler::takeListResult() {
    return list_results_.pop();
}

DownloadResult Scheduler::takeDownloadResult() {
    return download_results_.pop();
}

ProviderConfig Scheduler::providerConfig() const {
    ProviderConfig config;
    config.multi = multi_;
    config.cache_dir = cache_dir_;
    config.filemode = filemode_;
    config.api_key = api_key_;
    config.username = username_;
    config.password = password_;
    return config;
}

// An empty language list stands for every known language.
std::vector<std::string> Scheduler::wantedLanguages() const {
    return languages_.empty() ? languages::all() : languages_;
}

// A provider failing to judge a video only drops that provider for the video.
bool Scheduler::acceptsVideo(const ProviderEntry& provider, const Video& video) const {
    if (!provider.is_valid_video) {
        return true;
    }
    try {
        return provider.is_valid_video(video);
    } catch (const std::exception& e) {
        logging::error(LOGGER, "Provider " + provider.name + " failed to check " + video.path + ": " + e.what());
        return false;
    }
}

// Tasks queued before a failure still publish their results. Reading them
// keeps the channel in step with the next call. Without running workers they
// stay queued and are answered once the pool starts again.
template <typename T>
void Scheduler::discardResults(ResultChannel<T>& channel, size_t pending) {
    if (pending == 0 || state() != State::Running) {
        return;
    }
    logging::debug(LOGGER, "Discarding " + std::to_string(pending) + " results of an aborted call");
    for (; pending > 0; --pending) {
        channel.pop();
    }
}

void Scheduler::requireIdle() const {
    State current = state();
    if (current != State::Idle) {
        throw InvalidStateError(stateName(current), stateName(State::Idle));
    }
}
