#pragma once

#include "config.h"

namespace voxlink {

/**
 * @brief Exponential reconnect delay: initial, initial*multiplier, ... capped at max.
 *
 * Each delay is larger than the previous one until max is reached.
 * reset() after every successful connection starts over from initial.
 */
class ReconnectBackoff {
public:
    explicit ReconnectBackoff(const ReconnectConfig& config);

    /// Delay to wait before the next attempt; advances the sequence
    int next_delay_ms();

    /// Delay next_delay_ms() would return, without advancing
    int peek_delay_ms() const { return current_ms_; }

    void reset();

    int attempts() const { return attempts_; }

private:
    int initial_ms_;
    int max_ms_;
    double multiplier_;
    int current_ms_;
    int attempts_ = 0;
};

} // namespace voxlink
