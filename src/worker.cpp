#include "worker.hpp"
#include "errors.hpp"
#include "logging.hpp"

namespace {
    const std::string LOGGER = "subscout.worker";
}

struct Worker::Dispatch {
    Worker& worker;

    bool operator()(const ListTask& task) const {
        worker.list_results_.push(worker.runList(task));
        return true;
    }

    bool operator()(const DownloadTask& task) const {
        worker.download_results_.push(worker.runDownload(task));
        return true;
    }

    bool operator()(const StopTask&) const {
        logging::debug(LOGGER, "Poison pill received, terminating worker " + worker.name_);
        return false;
    }
};

Worker::Worker(std::string name,
               TaskQueue& queue,
               ResultChannel<ListResult>& list_results,
               ResultChannel<DownloadResult>& download_results,
               const ProviderRegistry& registry,
               const ProviderConfig& download_config)
    : name_(std::move(name)),
      queue_(queue),
      list_results_(list_results),
      download_results_(download_results),
      registry_(registry),
      download_config_(download_config) {}

void Worker::run() {
    bool running = true;
    while (running) {
        Task task = queue_.pop();
        running = std::visit(Dispatch{*this}, task);
        queue_.taskDone();
    }
    logging::debug(LOGGER, "Worker " + name_ + " terminated");
}

ListResult Worker::runList(const ListTask& task) {
    try {
        const ProviderEntry& entry = registry_.get(task.provider);
        auto provider = entry.create(task.config, shared_);
        ListResult result;
        result.emplace_back(task.video, provider->list(task.video, task.languages));
        logging::debug(LOGGER, task.provider + " listed " + std::to_string(result.front().second.size()) +
                               " subtitles for " + task.video->path);
        return result;
    } catch (const std::exception& e) {
        logging::error(LOGGER, "Exception raised in worker " + name_ + " while running " +
                               describeTask(task) + ": " + e.what());
        return {};
    }
}

DownloadResult Worker::runDownload(const DownloadTask& task) {
    DownloadResult result;
    try {
        for (const auto& subtitle : task.subtitles) {
            const ProviderEntry& entry = registry_.get(subtitle.provider);
            auto provider = entry.create(download_config_, shared_);
            try {
                result.push_back(provider->download(subtitle));
                break;
            } catch (const DownloadFailedError& e) {
                logging::warning(LOGGER, "Could not download subtitle " + subtitle.describe() +
                                         ", trying next: " + e.what());
            }
        }
    } catch (const std::exception& e) {
        logging::error(LOGGER, "Exception raised in worker " + name_ + " while running " +
                               describeTask(task) + ": " + e.what());
        result.clear();
    }

    if (result.empty()) {
        std::string video = task.subtitles.empty() ? "<unknown>" : task.subtitles.front().video->path;
        logging::error(LOGGER, "No subtitles could be downloaded for file " + video);
    }
    return result;
}

WorkerPool::WorkerPool(size_t workers,
                       TaskQueue& queue,
                       ResultChannel<ListResult>& list_results,
                       ResultChannel<DownloadResult>& download_results,
                       const ProviderRegistry& registry,
                       const ProviderConfig& download_config)
    : queue_(queue) {
    for (size_t i = 0; i < workers; ++i) {
        workers_.push_back(std::make_unique<Worker>("worker-" + std::to_string(i + 1), queue, list_results,
                                                    download_results, registry, download_config));
    }
}

WorkerPool::~WorkerPool() {
    if (running()) {
        stop(TaskQueue::PRIORITY_INTERRUPT);
    }
}

void WorkerPool::start() {
    if (running()) {
        throw InvalidStateError("running", "stopped");
    }
    for (auto& worker : workers_) {
        Worker* w = worker.get();
        threads_.emplace_back([w] { w->run(); });
        logging::debug(LOGGER, "Worker " + w->name() + " added to the pool");
    }
}

void WorkerPool::stop(int priority) {
    for (size_t i = 0; i < threads_.size(); ++i) {
        queue_.push(priority, StopTask{});
    }
    for (auto& thread : threads_) {
        thread.join();
    }
    threads_.clear();
}
