#pragma once

#include <string>

namespace voxplay::utils {

// "MM:SS", or "HH:MM:SS" from one hour on. Negative input prints as zero.
std::string format_duration(double seconds);

// "01:05 / 03:00"
std::string format_progress(double elapsed, double total);

} // namespace voxplay::utils
