#pragma once
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>
#include "provider.hpp"
#include "task_queue.hpp"

// A listing task yields at most one (video, subtitles) pair, a download task
// at most one subtitle. Failed tasks publish an empty result.
using ListResult = std::vector<std::pair<VideoPtr, std::vector<Subtitle>>>;
using DownloadResult = std::vector<Subtitle>;

class Worker {
public:
    Worker(std::string name,
           TaskQueue& queue,
           ResultChannel<ListResult>& list_results,
           ResultChannel<DownloadResult>& download_results,
           const ProviderRegistry& registry,
           const ProviderConfig& download_config);

    // Processes tasks until a StopTask is popped.
    void run();

    const std::string& name() const { return name_; }

private:
    struct Dispatch;

    std::string name_;
    TaskQueue& queue_;
    ResultChannel<ListResult>& list_results_;
    ResultChannel<DownloadResult>& download_results_;
    const ProviderRegistry& registry_;
    ProviderConfig download_config_;
    Scratch shared_;

    ListResult runList(const ListTask& task);
    DownloadResult runDownload(const DownloadTask& task);
};

class WorkerPool {
public:
    WorkerPool(size_t workers,
               TaskQueue& queue,
               ResultChannel<ListResult>& list_results,
               ResultChannel<DownloadResult>& download_results,
               const ProviderRegistry& registry,
               const ProviderConfig& download_config);

    // Interrupts and joins the workers if they are still running.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    void start();

    // Pushes one StopTask per worker at `priority` and joins every worker.
    void stop(int priority);

    bool running() const { return !threads_.empty(); }
    size_t size() const { return workers_.size(); }

private:
    TaskQueue& queue_;
    std::vector<std::unique_ptr<Worker>> workers_;
    std::vector<std::thread> threads_;
};
