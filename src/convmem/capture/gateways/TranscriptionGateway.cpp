#include "convmem/capture/gateways/TranscriptionGateway.h"

#include <algorithm>
#include <cctype>

#include "nlohmann/json.hpp"

namespace convmem::capture::gateways {

namespace {

std::string trimCopy(std::string s) {
    auto notSpace = [](unsigned char ch) { return !std::isspace(ch); };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
    s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    return s;
}

std::optional<std::string> extractTranscript(const nlohmann::json& event) {
    // Deepgram Results: {"channel": {"alternatives": [{"transcript": "..."}]}}
    if (event.contains("channel") && event["channel"].is_object()) {
        const auto& channel = event["channel"];
        if (channel.contains("alternatives") && channel["alternatives"].is_array() &&
            !channel["alternatives"].empty()) {
            const auto& first = channel["alternatives"][0];
            if (first.is_object() && first.contains("transcript") && first["transcript"].is_string()) {
                return first["transcript"].get<std::string>();
            }
        }
    }
    if (event.contains("transcript") && event["transcript"].is_string()) {
        return event["transcript"].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

std::optional<TranscriptFragment> parseTranscriptEvent(const std::string& message) {
    const auto event = nlohmann::json::parse(message, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
        return std::nullopt;
    }

    const bool isFinal = event.contains("is_final") && event["is_final"].is_boolean() && event["is_final"].get<bool>();
    if (!isFinal) {
        return std::nullopt;
    }

    auto transcript = extractTranscript(event);
    if (!transcript) {
        return std::nullopt;
    }
    auto text = trimCopy(*transcript);
    if (text.empty()) {
        return std::nullopt;
    }

    TranscriptFragment fragment;
    fragment.text = std::move(text);
    fragment.isFinal = true;
    if (event.contains("type") && event["type"].is_string()) {
        fragment.eventType = event["type"].get<std::string>();
    }
    return fragment;
}

} // namespace convmem::capture::gateways
