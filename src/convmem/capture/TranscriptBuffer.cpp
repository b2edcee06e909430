#include "convmem/capture/TranscriptBuffer.h"

#include <algorithm>

namespace convmem::capture {

TranscriptBuffer::TranscriptBuffer()
    : TranscriptBuffer(Config{})
{}

TranscriptBuffer::TranscriptBuffer(Config cfg)
    : m_cfg(cfg)
{
    // 至少保留一条最近记录
    m_cfg.recentCapacity = std::max<std::size_t>(1, m_cfg.recentCapacity);
}

std::string TranscriptBuffer::formatLine(const std::string& timestamp, const std::string& text) {
    return "[" + timestamp + "] " + text;
}

types::TranscriptEntry TranscriptBuffer::append(const std::string& text,
                                                double elapsedSeconds,
                                                std::chrono::system_clock::time_point wallClock) {
    types::TranscriptEntry entry;
    entry.timestamp = types::formatElapsed(elapsedSeconds);
    entry.elapsedSeconds = elapsedSeconds;
    entry.text = text;
    entry.datetime = types::formatIsoUtc(wallClock);

    auto line = formatLine(entry.timestamp, text);

    std::lock_guard<std::mutex> lk(m_mu);
    m_charCount += line.size() + 1;
    m_lines.push_back(std::move(line));
    evictLocked();

    m_recent.push_back(entry);
    while (m_recent.size() > m_cfg.recentCapacity) {
        m_recent.pop_front();
    }
    return entry;
}

void TranscriptBuffer::evictLocked() {
    while (m_charCount > m_cfg.maxChars && m_lines.size() > m_cfg.minLines) {
        m_charCount -= m_lines.front().size() + 1;
        m_lines.pop_front();
    }
}

std::vector<types::TranscriptEntry> TranscriptBuffer::recent(std::size_t n) const {
    std::lock_guard<std::mutex> lk(m_mu);
    const auto count = std::min(n, m_recent.size());
    return std::vector<types::TranscriptEntry>(m_recent.end() - static_cast<std::ptrdiff_t>(count), m_recent.end());
}

std::string TranscriptBuffer::compile() const {
    std::lock_guard<std::mutex> lk(m_mu);
    std::string out;
    out.reserve(m_charCount);
    for (const auto& line : m_lines) {
        if (!out.empty()) out.push_back('\n');
        out += line;
    }
    return out;
}

std::size_t TranscriptBuffer::lineCount() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_lines.size();
}

std::size_t TranscriptBuffer::charCount() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_charCount;
}

std::size_t TranscriptBuffer::recentCount() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_recent.size();
}

bool TranscriptBuffer::empty() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_lines.empty();
}

} // namespace convmem::capture
