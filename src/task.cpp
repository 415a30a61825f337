#include "task.hpp"
#include "utils.hpp"

namespace {
    struct TaskDescriber {
        std::string operator()(const ListTask& task) const {
            std::vector<std::string> languages(task.languages.begin(), task.languages.end());
            return "ListTask(" + task.video->path + ", " + task.provider + ", [" +
                   utils::joinStrings(languages, ",") + "])";
        }

        std::string operator()(const DownloadTask& task) const {
            std::string video = task.subtitles.empty() ? "<none>" : task.subtitles.front().video->path;
            return "DownloadTask(" + video + ", " + std::to_string(task.subtitles.size()) + " candidates)";
        }

        std::string operator()(const StopTask&) const {
            return "StopTask";
        }
    };
}

std::string describeTask(const Task& task) {
    return std::visit(TaskDescriber{}, task);
}
