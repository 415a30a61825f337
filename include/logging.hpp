#pragma once
#include <string>
#include <ostream>

namespace logging {
    enum class Level { Debug, Info, Warning, Error };

    void setLevel(Level level);
    Level level();

    // Records go to std::cerr unless another stream is set. Pass nullptr to restore.
    void setStream(std::ostream* stream);

    void debug(const std::string& logger, const std::string& message);
    void info(const std::string& logger, const std::string& message);
    void warning(const std::string& logger, const std::string& message);
    void error(const std::string& logger, const std::string& message);
}
