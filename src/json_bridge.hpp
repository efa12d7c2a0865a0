#pragma once

#include "sz/types.hpp"

#include <nlohmann/json.hpp>

namespace sz::bridge {

// Version tag written into every document crossing the engine boundary.
inline constexpr const char* kSchemaVersion = "sz/v1";

nlohmann::json to_json(const LearningItem& item);
LearningItem learning_item_from_json(const nlohmann::json& json_item);

nlohmann::json to_json(const ReviewState& state);
ReviewState review_state_from_json(const nlohmann::json& json_state);

nlohmann::json to_json(const InteractionEvent& event);
InteractionEvent interaction_event_from_json(const nlohmann::json& json_event);

nlohmann::json to_json(const EffectivenessSignal& signal);
EffectivenessSignal effectiveness_signal_from_json(const nlohmann::json& json_signal);

nlohmann::json to_json(const SessionContext& session);
SessionContext session_context_from_json(const nlohmann::json& json_session);

nlohmann::json to_json(const AdaptationHint& hint);
AdaptationHint adaptation_hint_from_json(const nlohmann::json& json_hint);

nlohmann::json to_json(const InteractResponse& response);

nlohmann::json to_json(const SessionSummary& summary);

} // namespace sz::bridge
