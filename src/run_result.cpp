#include "run_result.hpp"
#include <iomanip>
#include <sstream>

const char* runStatusName(RunStatus status) {
    return status == RunStatus::Success ? "Success" : "Failure";
}

std::string formatDuration(std::chrono::seconds duration) {
    auto total = duration.count() < 0 ? 0 : duration.count();
    std::ostringstream ss;
    ss << std::setfill('0') << std::setw(2) << total / 3600 << ':'
       << std::setw(2) << (total / 60) % 60 << ':'
       << std::setw(2) << total % 60;
    return ss.str();
}
