#include "domain/SegmentClock.hpp"
#include <stdexcept>

namespace streamscribe::domain {

SegmentClock::SegmentClock(std::chrono::milliseconds step, std::chrono::milliseconds maxDuration)
    : m_step(step), m_maxDuration(maxDuration) {
    if (m_step.count() <= 0) {
        throw std::invalid_argument("segment step must be positive");
    }
    if (m_maxDuration.count() < 0) {
        throw std::invalid_argument("maximum duration must not be negative");
    }
}

SegmentWindow SegmentClock::next(std::size_t index) const {
    SegmentWindow window;
    window.index = index;
    window.start = m_step * static_cast<long long>(index);
    window.duration = m_step;
    return window;
}

bool SegmentClock::isExhausted(std::size_t index) const {
    if (m_maxDuration.count() == 0) return false;
    return m_step * static_cast<long long>(index) >= m_maxDuration;
}

std::optional<std::size_t> SegmentClock::windowCount() const {
    if (m_maxDuration.count() == 0) return std::nullopt;
    const long long step = m_step.count();
    return static_cast<std::size_t>((m_maxDuration.count() + step - 1) / step);
}

} // namespace streamscribe::domain
