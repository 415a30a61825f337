#pragma once
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "provider.hpp"
#include "ranking.hpp"
#include "task_queue.hpp"
#include "worker.hpp"

struct SchedulerOptions {
    std::vector<std::string> languages;
    // Empty selects every API based provider of the registry.
    std::vector<std::string> providers;
    size_t workers = 4;
    bool multi = false;
    bool force = false;
    int max_depth = 3;
    // Empty selects ranking::defaultCriteria().
    std::vector<RankCriterion> sort_order;
    std::string cache_dir;
    std::optional<unsigned> filemode;
    std::string api_key;
    std::string username;
    std::string password;
};

// Owns the task queue, the result channels and the worker pool, and drives
// listing and downloading across providers.
//
//   Idle --start()--> Running --stopAndDrain()--> Idle
//                     Running --pauseNow()------> Paused (Idle if nothing is left queued)
//   Paused --start()--> Running
class Scheduler {
public:
    enum class State { Idle, Running, Paused };

    explicit Scheduler(const SchedulerOptions& options = SchedulerOptions(),
                       const ProviderRegistry& registry = ProviderRegistry::builtin());

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    const std::vector<std::string>& languages() const { return languages_; }
    // Throws InvalidLanguageError and keeps the current languages on an unknown code.
    void setLanguages(const std::vector<std::string>& languages);

    const std::vector<std::string>& providers() const { return providers_; }
    // Throws PluginError and keeps the current providers on an unknown name.
    void setProviders(const std::vector<std::string>& providers);

    const std::vector<RankCriterion>& sortOrder() const { return sort_order_; }
    void setSortOrder(const std::vector<RankCriterion>& sort_order);

    bool multi() const { return multi_; }
    void setMulti(bool multi) { multi_ = multi; }

    bool force() const { return force_; }
    void setForce(bool force) { force_ = force; }

    size_t workers() const { return workers_; }
    int maxDepth() const { return max_depth_; }
    const std::string& cacheDir() const { return cache_dir_; }

    // Lists the candidate subtitles of every video found under `entries`, one
    // element per (video, provider) listing that succeeded. With `auto_manage`
    // the workers are started and drained around the call, which requires Idle.
    std::vector<std::pair<VideoPtr, std::vector<Subtitle>>> listSubtitles(const std::vector<std::string>& entries,
                                                                          bool auto_manage = true);

    // Lists, ranks and downloads the best subtitle per video (per video and
    // language in multi mode). Videos without any downloadable candidate are
    // left out of the result.
    std::vector<Subtitle> downloadSubtitles(const std::vector<std::string>& entries, bool auto_manage = true);

    // Queues a list or download task at normal priority. Throws WrongTaskKindError for stop tasks.
    void submit(Task task);

    void start();
    void stopAndDrain();
    void pauseNow();

    State state() const;
    static std::string stateName(State state);

    // Blocking reads of the result channels, one per submitted task of that kind.
    ListResult takeListResult();
    DownloadResult takeDownloadResult();

    size_t queuedTasks() const { return queue_.pendingWork(); }

    // Queued entries including stop signals not yet taken by a worker.
    size_t queueLength() const { return queue_.size(); }

private:
    const ProviderRegistry& registry_;
    std::vector<std::string> languages_;
    std::vector<std::string> providers_;
    std::vector<RankCriterion> sort_order_;
    size_t workers_;
    bool multi_;
    bool force_;
    int max_depth_;
    std::string cache_dir_;
    std::optional<unsigned> filemode_;
    std::string api_key_;
    std::string username_;
    std::string password_;

    mutable std::mutex state_mutex_;
    State state_ = State::Idle;

    TaskQueue queue_;
    ResultChannel<ListResult> list_results_;
    ResultChannel<DownloadResult> download_results_;
    std::unique_ptr<WorkerPool> pool_;

    ProviderConfig providerConfig() const;
    std::vector<std::string> wantedLanguages() const;
    void requireIdle() const;
    bool acceptsVideo(const ProviderEntry& provider, const Video& video) const;

    template <typename T>
    void discardResults(ResultChannel<T>& channel, size_t pending);
};
