#include "version.hpp"

namespace version {
    std::string userAgent() {
        return "subscout v" + std::string(CURRENT_VERSION);
    }
}
