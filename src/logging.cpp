#include "logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
    std::atomic<logging::Level> currentLevel{logging::Level::Warning};
    std::ostream* currentStream = nullptr;
    std::mutex streamMutex;

    const char* levelName(logging::Level level) {
        switch (level) {
            case logging::Level::Debug: return "DEBUG";
            case logging::Level::Info: return "INFO";
            case logging::Level::Warning: return "WARNING";
            case logging::Level::Error: return "ERROR";
        }
        return "UNKNOWN";
    }

    void write(logging::Level level, const std::string& logger, const std::string& message) {
        if (level < currentLevel.load()) {
            return;
        }
        std::lock_guard<std::mutex> lock(streamMutex);
        std::ostream& out = currentStream ? *currentStream : std::cerr;
        out << levelName(level) << " [" << logger << "] " << message << "\n";
        out.flush();
    }
}

namespace logging {
    void setLevel(Level level) {
        currentLevel.store(level);
    }

    Level level() {
        return currentLevel.load();
    }

    void setStream(std::ostream* stream) {
        std::lock_guard<std::mutex> lock(streamMutex);
        currentStream = stream;
    }

    void debug(const std::string& logger, const std::string& message) {
        write(Level::Debug, logger, message);
    }

    void info(const std::string& logger, const std::string& message) {
        write(Level::Info, logger, message);
    }

    void warning(const std::string& logger, const std::string& message) {
        write(Level::Warning, logger, message);
    }

    void error(const std::string& logger, const std::string& message) {
        write(Level::Error, logger, message);
    }
}
