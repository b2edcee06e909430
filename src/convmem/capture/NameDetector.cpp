#include "convmem/capture/NameDetector.h"

#include <algorithm>
#include <cctype>

namespace convmem::capture {

namespace {

std::string trimCopy(std::string s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

bool isAlphaWord(const std::string& w) {
    return !w.empty() && std::all_of(w.begin(), w.end(), [](unsigned char c) { return std::isalpha(c) != 0; });
}

std::string capitalize(std::string w) {
    std::transform(w.begin(), w.end(), w.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!w.empty()) w[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(w[0])));
    return w;
}

constexpr auto kFlags = std::regex::ECMAScript | std::regex::icase;

} // namespace

NameDetector::NameDetector()
    : NameDetector(Config{})
{}

NameDetector::NameDetector(Config cfg)
    : m_cfg(cfg)
    , m_terminator("[.!?,;]")
    , m_filler("\\b(and|but|so)\\b.*", kFlags)
    , m_wordSplit("[\\s\\-]+")
{
    m_patterns.emplace_back("\\bmy name is\\s+([a-zA-Z][a-zA-Z\\s'-]{1,40})", kFlags);
    m_patterns.emplace_back("\\bcall me\\s+([a-zA-Z][a-zA-Z\\s'-]{1,40})", kFlags);
}

std::optional<std::string> NameDetector::detect(const std::string& text) const {
    const auto normalized = trimCopy(text);
    if (normalized.empty()) {
        return std::nullopt;
    }

    for (const auto& pattern : m_patterns) {
        std::smatch match;
        if (!std::regex_search(normalized, match, pattern)) {
            continue;
        }
        if (auto name = normalizeCandidate(match[1].str())) {
            return name;
        }
    }
    return std::nullopt;
}

std::optional<std::string> NameDetector::normalizeCandidate(const std::string& raw) const {
    std::string candidate = raw;

    std::smatch term;
    if (std::regex_search(candidate, term, m_terminator)) {
        candidate = candidate.substr(0, static_cast<std::size_t>(term.position(0)));
    }
    candidate = trimCopy(std::regex_replace(trimCopy(candidate), m_filler, ""));

    std::vector<std::string> words;
    std::sregex_token_iterator it(candidate.begin(), candidate.end(), m_wordSplit, -1);
    for (std::sregex_token_iterator end; it != end; ++it) {
        if (it->length() > 0) words.push_back(it->str());
    }

    if (words.empty() || words.size() > m_cfg.maxWords) {
        return std::nullopt;
    }
    for (const auto& w : words) {
        if (w.size() < m_cfg.minWordLength || !isAlphaWord(w)) {
            return std::nullopt;
        }
    }

    std::string formatted;
    for (const auto& w : words) {
        if (!formatted.empty()) formatted.push_back(' ');
        formatted += capitalize(w);
    }
    if (formatted.size() < m_cfg.minWordLength + 1) {
        return std::nullopt;
    }
    return formatted;
}

} // namespace convmem::capture
