#pragma once

#include "convmem/capture/types/SessionTypes.h"

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace convmem::capture {

/**
 * @brief 带字符预算的转写行存储 + "最近转写"环形缓冲
 *
 * - 完整转写：`[HH:MM:SS] text` 行的有序列表，按"行长+1"（换行符）累计字符数。
 *   当字符数超出预算且行数多于最小保留行数时，从最旧的行开始淘汰。
 * - 最近转写：固定容量的原始条目环，与上面的淘汰互不影响。
 *
 * 线程安全：内部加锁，统计读取与接收管线的写入可并发。
 */
class TranscriptBuffer {
public:
    struct Config {
        std::size_t maxChars{20000};
        std::size_t minLines{50};
        std::size_t recentCapacity{100};
    };

    TranscriptBuffer();
    explicit TranscriptBuffer(Config cfg);

    /**
     * @brief 追加一条定稿片段
     * @param text 片段原文
     * @param elapsedSeconds 相对会话开始的秒数
     * @param wallClock 收到片段的墙钟时间
     * @return 写入"最近转写"环的条目
     */
    types::TranscriptEntry append(const std::string& text,
                                  double elapsedSeconds,
                                  std::chrono::system_clock::time_point wallClock = std::chrono::system_clock::now());

    // 最近 n 条（按时间先后），n 大于现有条目数时返回全部
    std::vector<types::TranscriptEntry> recent(std::size_t n) const;

    // 以换行连接所有保留行；无保留行时返回空串
    std::string compile() const;

    std::size_t lineCount() const;
    std::size_t charCount() const;
    std::size_t recentCount() const;
    bool empty() const;

    const Config& config() const { return m_cfg; }

    static std::string formatLine(const std::string& timestamp, const std::string& text);

private:
    void evictLocked();

    Config m_cfg;
    mutable std::mutex m_mu;
    std::deque<std::string> m_lines;
    std::size_t m_charCount{0};
    std::deque<types::TranscriptEntry> m_recent;
};

} // namespace convmem::capture
