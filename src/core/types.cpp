// StreamProv - Dedicated stream provisioning service
// Common type helpers

#include "streamprov/core/types.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace streamprov {
namespace core {

std::string formatIso8601(TimePoint tp) {
    auto secondsSinceEpoch = SystemClock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;
    if (ms < 0) {
        ms += 1000;
    }

    std::tm tmBuf{};
    gmtime_r(&secondsSinceEpoch, &tmBuf);

    std::ostringstream oss;
    oss << std::put_time(&tmBuf, "%Y-%m-%dT%H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms << "Z";
    return oss.str();
}

} // namespace core
} // namespace streamprov
