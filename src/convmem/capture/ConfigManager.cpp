#include "convmem/capture/ConfigManager.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace convmem::capture {

static std::string trimCopy(std::string s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 落盘的是模板（保留 ${...} 占位符），不是内存中已替换的配置
        ErrorInfo saveErr;
        const bool saved = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::ConfigurationError;
            err->errorCode = 0;
            err->message = "Config file not found, using default config: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", saved}
            };
            if (!saved) (*err->details)["auto_create_failed"] = saveErr.toJson();
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const std::exception& e) {
        if (err) {
            err->errorType = ErrorType::ConfigurationError;
            err->errorCode = 0;
            err->message = std::string("Config JSON parse failed: ") + e.what();
            err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        }
        return false;
    }

    if (!parsed.is_object()) {
        setError(err, ErrorType::ConfigurationError, "Config root must be a JSON object");
        return false;
    }

    // 未出现的键沿用默认值
    nlohmann::json merged = makeDefaultConfig();
    merged.merge_patch(parsed);

    applyEnvMappingOverrides(merged);
    replaceEnvPlaceholdersRecursive(merged);

    std::lock_guard<std::mutex> lk(m_mu);
    m_cfg = std::move(merged);
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    try {
        const std::filesystem::path p(path);
        const auto parent = p.parent_path();
        if (!parent.empty()) {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
            if (ec && !std::filesystem::exists(parent)) {
                if (err) {
                    setError(err, ErrorType::ConfigurationError, "Failed to create config directory: " + parent.string(), 1);
                    err->details = nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}};
                }
                return false;
            }
        }

        std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.is_open()) {
            setError(err, ErrorType::ConfigurationError, "Failed to open config file for write: " + path, 2);
            return false;
        }

        ofs << makeDefaultConfig().dump(2) << "\n";
        ofs.flush();
        return static_cast<bool>(ofs);
    } catch (const std::exception& e) {
        setError(err, ErrorType::ConfigurationError, std::string("Failed to save config file: ") + e.what(), 3);
        return false;
    }
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

std::string ConfigManager::getString(const std::string& keyPath, const std::string& fallback) const {
    auto v = get(keyPath);
    if (!v || !v->is_string()) return fallback;
    return v->get<std::string>();
}

long long ConfigManager::getInt(const std::string& keyPath, long long fallback) const {
    auto v = get(keyPath);
    if (!v || !v->is_number_integer()) return fallback;
    return v->get<long long>();
}

bool ConfigManager::getBool(const std::string& keyPath, bool fallback) const {
    auto v = get(keyPath);
    if (!v || !v->is_boolean()) return fallback;
    return v->get<bool>();
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        setError(err, ErrorType::InvalidRequest, "Empty keyPath");
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    if (!p) {
        setError(err, ErrorType::InvalidRequest, "Failed to create keyPath: " + keyPath);
        return false;
    }
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    return nlohmann::json{
        {"stt", {
            {"url", "wss://api.deepgram.com/v1/listen"},
            {"api_key", "${DEEPGRAM_API_KEY}"},
            {"sample_rate", 16000},
            {"channels", 1},
            {"encoding", "linear16"},
            {"punctuate", true},
            {"model", ""},
            {"language", ""},
            {"connect_timeout_ms", 10000}
        }},
        {"audio", {
            {"frames_per_buffer", 8000},
            {"device_name", ""},
            {"max_queued_frames", 1200}
        }},
        {"transcript", {
            {"max_chars", 20000},
            {"min_lines", 50},
            {"recent_capacity", 100}
        }},
        {"persistence", {
            {"sqlite_path", "data/convmem.db"},
            {"busy_timeout_ms", 5000}
        }},
        {"analysis", {
            {"enabled", true},
            {"base_url", "${ANALYSIS_BASE_URL}"},
            {"api_key", "${ANALYSIS_API_KEY}"},
            {"path", "/api/conversations/{id}/analyze"},
            {"timeout_ms", 60000}
        }},
        {"session", {
            {"startup_timeout_ms", 1000},
            {"stop_timeout_ms", 5000},
            {"close_timeout_ms", 3000},
            {"sender", "user"}
        }},
        {"logging", {
            {"min_level", "info"}
        }}
    };
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKeyPath(keyPath)) return value;
    const auto v = trimCopy(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

bool ConfigManager::isUnresolvedPlaceholder(const std::string& value) {
    const auto v = trimCopy(value);
    return startsWith(v, "${") && v.find('}') != std::string::npos;
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
    if (s.empty()) return std::nullopt;
    return s;
}

bool ConfigManager::isSensitiveKeyPath(const std::string& keyPath) {
    std::string low = keyPath;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return low.find("api_key") != std::string::npos || low.find("apikey") != std::string::npos || low.find("secret") != std::string::npos;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        if (!p->contains(k)) return nullptr;
        p = &((*p)[k]);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
    };
    const MapItem mapping[] = {
        {"DEEPGRAM_API_KEY", "stt.api_key"},
        {"DEEPGRAM_URL", "stt.url"},
        {"CONVMEM_DB_PATH", "persistence.sqlite_path"},
        {"ANALYSIS_BASE_URL", "analysis.base_url"},
        {"ANALYSIS_API_KEY", "analysis.api_key"},
        {"CONVMEM_LOG_LEVEL", "logging.min_level"},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        const auto val = trimCopy(v.value());
        if (val.empty()) continue;
        nlohmann::json* p = getOrCreatePtrByPath(root, splitKeyPath(m.keyPath));
        if (p) *p = val;
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            replaceEnvPlaceholdersRecursive(it.value());
        }
        return;
    }
    if (node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME} 形式的占位符；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    auto requireObject = [&](const char* key) -> const nlohmann::json* {
        if (!cfgCopy.contains(key) || !cfgCopy[key].is_object()) {
            out.push_back(std::string("Missing or invalid '") + key + "' object");
            return nullptr;
        }
        return &cfgCopy[key];
    };
    auto checkPositiveInt = [&](const nlohmann::json& obj, const std::string& prefix, const char* key, long long maxValue) {
        if (!obj.contains(key)) return;
        if (!obj[key].is_number_integer()) {
            out.push_back("Invalid '" + prefix + "." + key + "' (integer required)");
            return;
        }
        const auto v = obj[key].get<long long>();
        if (v <= 0 || v > maxValue) {
            out.push_back("Invalid '" + prefix + "." + key + "' (range 1.." + std::to_string(maxValue) + ")");
        }
    };

    // stt
    if (const auto* stt = requireObject("stt")) {
        const auto url = (stt->contains("url") && (*stt)["url"].is_string()) ? trimCopy((*stt)["url"].get<std::string>()) : "";
        if (!(startsWith(url, "wss://") || startsWith(url, "ws://"))) {
            out.push_back("Invalid 'stt.url' (must start with ws:// or wss://)");
        } else if (startsWith(url, "ws://")) {
            out.push_back("WARN: 'stt.url' uses plain ws://, only wss:// is supported by the Deepgram gateway");
        }
        const auto key = (stt->contains("api_key") && (*stt)["api_key"].is_string()) ? (*stt)["api_key"].get<std::string>() : "";
        if (trimCopy(key).empty() || isUnresolvedPlaceholder(key)) {
            out.push_back("WARN: 'stt.api_key' is not set; each session must supply its own credential");
        }
        checkPositiveInt(*stt, "stt", "sample_rate", 192000);
        checkPositiveInt(*stt, "stt", "channels", 8);
        checkPositiveInt(*stt, "stt", "connect_timeout_ms", 300000);
    }

    if (const auto* audio = requireObject("audio")) {
        checkPositiveInt(*audio, "audio", "frames_per_buffer", 192000);
        checkPositiveInt(*audio, "audio", "max_queued_frames", 1000000);
    }

    if (const auto* transcript = requireObject("transcript")) {
        checkPositiveInt(*transcript, "transcript", "max_chars", 100000000);
        checkPositiveInt(*transcript, "transcript", "min_lines", 1000000);
        checkPositiveInt(*transcript, "transcript", "recent_capacity", 1000000);
    }

    if (const auto* persistence = requireObject("persistence")) {
        if (!persistence->contains("sqlite_path") || !(*persistence)["sqlite_path"].is_string() ||
            trimCopy((*persistence)["sqlite_path"].get<std::string>()).empty()) {
            out.push_back("Missing or invalid 'persistence.sqlite_path' (string required)");
        }
        checkPositiveInt(*persistence, "persistence", "busy_timeout_ms", 600000);
    }

    if (const auto* analysis = requireObject("analysis")) {
        const bool enabled = !analysis->contains("enabled") || !(*analysis)["enabled"].is_boolean() ||
                             (*analysis)["enabled"].get<bool>();
        if (enabled) {
            const auto base = (analysis->contains("base_url") && (*analysis)["base_url"].is_string())
                                  ? trimCopy((*analysis)["base_url"].get<std::string>())
                                  : "";
            if (base.empty() || isUnresolvedPlaceholder(base)) {
                out.push_back("WARN: 'analysis.base_url' is not set; analysis will be skipped");
            } else if (!(startsWith(base, "http://") || startsWith(base, "https://"))) {
                out.push_back("Invalid 'analysis.base_url' (must start with http:// or https://)");
            }
        }
        checkPositiveInt(*analysis, "analysis", "timeout_ms", 600000);
    }

    if (const auto* session = requireObject("session")) {
        checkPositiveInt(*session, "session", "startup_timeout_ms", 600000);
        checkPositiveInt(*session, "session", "stop_timeout_ms", 600000);
        checkPositiveInt(*session, "session", "close_timeout_ms", 600000);
    }

    if (cfgCopy.contains("logging") && cfgCopy["logging"].is_object() && cfgCopy["logging"].contains("min_level")) {
        const auto& lv = cfgCopy["logging"]["min_level"];
        static const char* kLevels[] = {"error", "warn", "warning", "info", "debug"};
        bool ok = false;
        if (lv.is_string()) {
            std::string low = lv.get<std::string>();
            std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            ok = std::find(std::begin(kLevels), std::end(kLevels), low) != std::end(kLevels);
        }
        if (!ok) out.push_back("Invalid 'logging.min_level' (error|warning|info|debug)");
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!startsWith(s, "WARN:")) return true;
    }
    return false;
}

bool ConfigManager::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace convmem::capture
