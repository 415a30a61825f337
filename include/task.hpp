#pragma once
#include <set>
#include <string>
#include <variant>
#include <vector>
#include "provider.hpp"
#include "subtitle.hpp"
#include "video.hpp"

// List the subtitles of one video at one provider.
struct ListTask {
    VideoPtr video;
    std::set<std::string> languages;
    std::string provider;
    ProviderConfig config;
};

// Download the first subtitle that succeeds, trying them in order.
struct DownloadTask {
    std::vector<Subtitle> subtitles;
};

// Terminates the worker that pops it.
struct StopTask {};

using Task = std::variant<ListTask, DownloadTask, StopTask>;

std::string describeTask(const Task& task);
