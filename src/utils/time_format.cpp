#include "utils/time_format.hpp"

#include <cmath>
#include <cstdio>

namespace voxplay::utils {

std::string format_duration(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) seconds = 0.0;
    long total = static_cast<long>(std::floor(seconds));
    long hours = total / 3600;
    long minutes = (total % 3600) / 60;
    long secs = total % 60;

    char buf[32];
    if (hours > 0) {
        std::snprintf(buf, sizeof(buf), "%02ld:%02ld:%02ld", hours, minutes, secs);
    } else {
        std::snprintf(buf, sizeof(buf), "%02ld:%02ld", minutes, secs);
    }
    return buf;
}

std::string format_progress(double elapsed, double total) {
    return format_duration(elapsed) + " / " + format_duration(total);
}

} // namespace voxplay::utils
