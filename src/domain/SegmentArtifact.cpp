#include "domain/SegmentArtifact.hpp"
#include <atomic>
#include <filesystem>
#include <iostream>
#include <system_error>

namespace streamscribe::domain {

namespace {
std::atomic<int> g_liveArtifacts{0};
}

SegmentArtifact::SegmentArtifact(std::string path, const SegmentWindow& window)
    : m_path(std::move(path)), m_window(window), m_owned(true) {
    ++g_liveArtifacts;
}

SegmentArtifact::~SegmentArtifact() {
    release();
}

SegmentArtifact::SegmentArtifact(SegmentArtifact&& other) noexcept
    : m_path(std::move(other.m_path)), m_window(other.m_window), m_owned(other.m_owned) {
    other.m_owned = false;
}

SegmentArtifact& SegmentArtifact::operator=(SegmentArtifact&& other) noexcept {
    if (this != &other) {
        release();
        m_path = std::move(other.m_path);
        m_window = other.m_window;
        m_owned = other.m_owned;
        other.m_owned = false;
    }
    return *this;
}

void SegmentArtifact::release() {
    if (!m_owned) return;
    m_owned = false;
    --g_liveArtifacts;

    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    if (ec) {
        std::cerr << "[SegmentArtifact] Failed to delete " << m_path << ": " << ec.message() << std::endl;
    }
}

int SegmentArtifact::LiveCount() {
    return g_liveArtifacts.load();
}

} // namespace streamscribe::domain
