#pragma once

#include "abr_session_manager.hpp"
#include "config.hpp"
#include "quality_variant.hpp"
#include "room_registry.hpp"
#include <nlohmann/json.hpp>

namespace sdc {

// JSON views shared by the signaling and HTTP servers. Timestamps are epoch milliseconds.

void to_json(nlohmann::json& j, const QualityVariant& v);
void to_json(nlohmann::json& j, const AbrManifest& m);
void to_json(nlohmann::json& j, const TelemetryResult& r);
void to_json(nlohmann::json& j, const SessionSnapshot& s);
void to_json(nlohmann::json& j, const SessionSummary& s);
void to_json(nlohmann::json& j, const RoomSnapshot& r);

// ICE servers (STUN list plus optional TURN) and pool size, as browsers expect
nlohmann::json rtc_configuration(const WebRtcConfig& cfg);

// Capture constraints sent with getConfig
nlohmann::json media_constraints();

nlohmann::json error_body(const char* code, const std::string& message);

} // namespace sdc
