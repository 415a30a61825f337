#include "subtitle.hpp"
#include <iomanip>
#include <sstream>

std::string Subtitle::describe() const {
    std::ostringstream ss;
    ss << provider << " [" << language << "] ";
    ss << (release.empty() ? std::string("<no release>") : release);
    ss << " (" << std::fixed << std::setprecision(2) << confidence << ")";
    return ss.str();
}
