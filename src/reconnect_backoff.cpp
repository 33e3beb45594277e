#include "reconnect_backoff.h"
#include <algorithm>
#include <cmath>

namespace voxlink {

ReconnectBackoff::ReconnectBackoff(const ReconnectConfig& config)
    : initial_ms_(std::max(1, config.initial_ms)),
      max_ms_(std::max(std::max(1, config.initial_ms), config.max_ms)),
      multiplier_(std::max(1.0, config.multiplier)),
      current_ms_(initial_ms_) {}

int ReconnectBackoff::next_delay_ms() {
    int delay = current_ms_;
    // Strictly increasing until the cap, even when rounding would stall it
    double next = std::max(static_cast<double>(current_ms_) + 1.0,
                           std::ceil(static_cast<double>(current_ms_) * multiplier_));
    current_ms_ = next >= max_ms_ ? max_ms_ : static_cast<int>(next);
    attempts_++;
    return delay;
}

void ReconnectBackoff::reset() {
    current_ms_ = initial_ms_;
    attempts_ = 0;
}

} // namespace voxlink
