#pragma once

#include "recall/test_builder.hpp"
#include "recall/types.hpp"

#include <nlohmann/json.hpp>

namespace recall::bridge {

nlohmann::json to_json(const NormativeProfile& profile);
NormativeProfile normative_profile_from_json(const nlohmann::json& json_profile);

nlohmann::json to_json(const Keypoint& keypoint);
Keypoint keypoint_from_json(const nlohmann::json& json_keypoint);

nlohmann::json to_json(const TestInstance& test);
TestInstance test_instance_from_json(const nlohmann::json& json_test);

nlohmann::json to_json(const KeypointResult& result);
KeypointResult keypoint_result_from_json(const nlohmann::json& json_result);

nlohmann::json to_json(const SessionResult& result);
SessionResult session_result_from_json(const nlohmann::json& json_result);

nlohmann::json to_json(const TestPlan& plan);
TestPlan test_plan_from_json(const nlohmann::json& json_plan);

TestConfig test_config_from_json(const nlohmann::json& json_config);

GeneratedContent generated_content_from_json(const nlohmann::json& json_content);

} // namespace recall::bridge
