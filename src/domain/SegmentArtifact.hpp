/**
 * @file SegmentArtifact.hpp
 * @brief Exclusively-owned on-disk audio unit for one SegmentWindow.
 */

#pragma once
#include "domain/SegmentWindow.hpp"
#include <string>

namespace streamscribe::domain {

/**
 * @class SegmentArtifact
 * @brief Move-only owner of a 16 kHz mono PCM file covering one window.
 *
 * The backing file is deleted when the owner releases it or goes out of
 * scope. LiveCount() reports how many owning artifacts currently exist.
 */
class SegmentArtifact {
public:
    SegmentArtifact() = default;
    SegmentArtifact(std::string path, const SegmentWindow& window);
    ~SegmentArtifact();

    SegmentArtifact(const SegmentArtifact&) = delete;
    SegmentArtifact& operator=(const SegmentArtifact&) = delete;
    SegmentArtifact(SegmentArtifact&& other) noexcept;
    SegmentArtifact& operator=(SegmentArtifact&& other) noexcept;

    bool valid() const { return m_owned; }
    const std::string& path() const { return m_path; }
    const SegmentWindow& window() const { return m_window; }

    /** @brief Deletes the backing file. Safe to call more than once. */
    void release();

    static int LiveCount();

private:
    std::string m_path;
    SegmentWindow m_window;
    bool m_owned = false;
};

} // namespace streamscribe::domain
