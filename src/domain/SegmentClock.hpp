/**
 * @file SegmentClock.hpp
 * @brief Fixed-cadence source of segment boundaries.
 */

#pragma once
#include "domain/SegmentWindow.hpp"
#include <chrono>
#include <cstddef>
#include <optional>

namespace streamscribe::domain {

/**
 * @class SegmentClock
 * @brief Maps a sequence index to its SegmentWindow.
 *
 * Stateless and restartable: next(i) depends only on the step and on i.
 * A zero maximum duration means the clock never runs out.
 */
class SegmentClock {
public:
    SegmentClock(std::chrono::milliseconds step, std::chrono::milliseconds maxDuration);

    /** @brief Window i: start = i * step, duration = step. */
    SegmentWindow next(std::size_t index) const;

    /** @brief True once window i would start at or past the maximum duration. */
    bool isExhausted(std::size_t index) const;

    /** @brief Number of windows the clock issues, or nullopt when unbounded. */
    std::optional<std::size_t> windowCount() const;

    std::chrono::milliseconds step() const { return m_step; }

private:
    std::chrono::milliseconds m_step;
    std::chrono::milliseconds m_maxDuration;
};

} // namespace streamscribe::domain
