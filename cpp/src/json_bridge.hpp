#pragma once

#include "../include/recall/practice_engine.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace recall::bridge {

nlohmann::json to_json(const ContentItem& item);
ContentItem content_item_from_json(const nlohmann::json& json_item);

// Accepts either an array of items or an object with an "items" array.
std::vector<ContentItem> load_content_items(const nlohmann::json& document);
std::vector<ContentItem> load_content_items_file(const std::string& path);

nlohmann::json to_json(const Submission& submission);
Submission submission_from_json(const nlohmann::json& json_submission);

nlohmann::json to_json(const EvaluationResult& result);
EvaluationResult evaluation_result_from_json(const nlohmann::json& json_result);

nlohmann::json to_json(const SchedulingRecord& record);
SchedulingRecord scheduling_record_from_json(const nlohmann::json& json_record);

nlohmann::json to_json(const SessionConfiguration& configuration);
SessionConfiguration session_configuration_from_json(const nlohmann::json& json_configuration);

nlohmann::json to_json(const PracticeSession& session);
PracticeSession practice_session_from_json(const nlohmann::json& json_session);

nlohmann::json to_json(const SubmitOutcome& outcome);
nlohmann::json to_json(const SessionSnapshot& snapshot);
nlohmann::json to_json(const CreatedSession& created);
nlohmann::json to_json(const Composition& composition);
nlohmann::json to_json(const scheduler::ScheduleStats& stats);
nlohmann::json to_json(const std::vector<scheduler::DailyLoad>& forecast);

nlohmann::json to_json(const EngineConfig& config);
EngineConfig engine_config_from_json(const nlohmann::json& json_config);

} // namespace recall::bridge
