#pragma once
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "errors.hpp"
#include "provider.hpp"

// Scripted provider behaviour shared between a test and every FakeProvider
// instance the workers create for it.
struct FakeBehavior {
    std::mutex mutex;
    std::condition_variable changed;

    std::vector<Subtitle> listing;
    bool list_throws = false;
    std::set<std::string> failing_downloads;
    std::set<std::string> broken_downloads;

    bool gated = false;
    bool gate_open = false;
    int entered = 0;

    int list_calls = 0;
    std::vector<std::string> download_attempts;
    std::vector<int> scratch_counts;

    void openGate() {
        std::lock_guard<std::mutex> lock(mutex);
        gate_open = true;
        changed.notify_all();
    }

    void waitEntered(int count) {
        std::unique_lock<std::mutex> lock(mutex);
        changed.wait(lock, [this, count] { return entered >= count; });
    }
};

inline Subtitle makeSubtitle(const std::string& language, double confidence, const std::string& release = "") {
    Subtitle subtitle;
    subtitle.language = language;
    subtitle.confidence = confidence;
    subtitle.release = release;
    return subtitle;
}

class FakeProvider : public Provider {
public:
    FakeProvider(std::string name, std::shared_ptr<FakeBehavior> behavior, Scratch& shared)
        : name_(std::move(name)), behavior_(std::move(behavior)), shared_(shared) {}

    std::vector<Subtitle> list(const VideoPtr& video, const std::set<std::string>& languages) override {
        int count = shared_.count("calls") ? std::stoi(shared_["calls"]) + 1 : 1;
        shared_["calls"] = std::to_string(count);

        std::unique_lock<std::mutex> lock(behavior_->mutex);
        behavior_->list_calls++;
        behavior_->scratch_counts.push_back(count);
        behavior_->entered++;
        behavior_->changed.notify_all();
        if (behavior_->gated) {
            behavior_->changed.wait(lock, [this] { return behavior_->gate_open; });
        }
        if (behavior_->list_throws) {
            throw PluginError(name_ + " is down");
        }

        std::vector<Subtitle> result;
        for (auto subtitle : behavior_->listing) {
            if (!languages.count(subtitle.language)) {
                continue;
            }
            subtitle.video = video;
            subtitle.provider = name_;
            subtitle.path = providers::subtitlePath(*video, subtitle.language, false);
            result.push_back(subtitle);
        }
        return result;
    }

    Subtitle download(const Subtitle& subtitle) override {
        std::lock_guard<std::mutex> lock(behavior_->mutex);
        std::string id = name_ + ":" + subtitle.release;
        behavior_->download_attempts.push_back(id);
        if (behavior_->failing_downloads.count(id)) {
            throw DownloadFailedError(id + " failed");
        }
        if (behavior_->broken_downloads.count(id)) {
            throw std::runtime_error(id + " is broken");
        }
        return subtitle;
    }

private:
    std::string name_;
    std::shared_ptr<FakeBehavior> behavior_;
    Scratch& shared_;
};

inline ProviderEntry fakeEntry(const std::string& name, std::shared_ptr<FakeBehavior> behavior,
                               std::set<std::string> languages = {"en", "fr", "de"}, bool api_based = true) {
    return ProviderEntry{
        name,
        api_based,
        std::move(languages),
        [](const Video&) { return true; },
        [name, behavior](const ProviderConfig&, Scratch& shared) -> std::unique_ptr<Provider> {
            return std::make_unique<FakeProvider>(name, behavior, shared);
        }
    };
}
