#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include <voxturn/core/messages.hpp>

namespace voxturn {
namespace wire {

// JSON text frames exchanged with the assistant service. Binary fields
// (audio, conversation state, screen data) travel base64 encoded.

nlohmann::json encodeOutbound(const OutboundMessage& msg);
nlohmann::json encodeAudioInDone();

// Throws json::parse_error on bad JSON, std::invalid_argument on non-objects.
InboundMessage parseInbound(const std::string& payload);
InboundMessage decodeInbound(const nlohmann::json& j);

// One line summary without audio payloads, for debug logging.
std::string summarize(const InboundMessage& msg);

} // namespace wire
} // namespace voxturn
