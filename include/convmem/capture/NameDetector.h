#pragma once

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace convmem::capture {

/**
 * @brief 从转写片段中提取对方姓名的模式匹配器（无状态）
 *
 * 依次尝试 "my name is X"、"call me X"（不区分大小写）。命中后：
 * 1. 在第一个 . ! ? , ; 处截断
 * 2. 去掉 and / but / so 及其后的内容
 * 3. 按空白与连字符切词，要求 1..maxWords 个词，每个词全为字母且长度 >= minWordLength
 * 4. 各词首字母大写后以空格连接，整体长度需 >= minWordLength + 1
 * 校验失败时继续尝试下一个模式。
 */
class NameDetector {
public:
    struct Config {
        std::size_t maxWords{3};
        std::size_t minWordLength{2};
    };

    NameDetector();
    explicit NameDetector(Config cfg);

    std::optional<std::string> detect(const std::string& text) const;

private:
    std::optional<std::string> normalizeCandidate(const std::string& raw) const;

    Config m_cfg;
    std::vector<std::regex> m_patterns;
    std::regex m_terminator;
    std::regex m_filler;
    std::regex m_wordSplit;
};

} // namespace convmem::capture
