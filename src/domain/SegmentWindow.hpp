/**
 * @file SegmentWindow.hpp
 * @brief Half-open time interval of the live capture assigned to one segment.
 */

#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace streamscribe::domain {

/**
 * @struct SegmentWindow
 * @brief Interval [start, start + duration) relative to capture start.
 *
 * Produced by the SegmentClock once per tick and never mutated afterwards.
 */
struct SegmentWindow {
    std::size_t index = 0;                    ///< Zero-based sequence index.
    std::chrono::milliseconds start{0};       ///< Offset from capture start.
    std::chrono::milliseconds duration{0};    ///< Window length.

    std::chrono::milliseconds end() const { return start + duration; }
};

/** @brief Formats a duration as seconds with millisecond precision (e.g. "15.000"). */
std::string FormatSeconds(std::chrono::milliseconds value);

} // namespace streamscribe::domain
