#include "json_bridge.hpp"

#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace recall::bridge {
namespace {

const nlohmann::json& require_field(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object()) {
    throw std::invalid_argument("Expected object while reading field '" + std::string(key) + "'");
  }
  if (!obj.contains(key)) {
    throw std::invalid_argument("Missing field '" + std::string(key) + "'");
  }
  return obj[key];
}

bool has_value(const nlohmann::json& obj, const char* key) {
  return obj.is_object() && obj.contains(key) && !obj[key].is_null();
}

int json_to_int(const nlohmann::json& value, std::string_view key) {
  if (value.is_number_integer()) {
    return value.get<int>();
  }
  if (value.is_number_float()) {
    return static_cast<int>(std::lround(value.get<double>()));
  }
  throw std::invalid_argument("Expected integer for field '" + std::string(key) + "'");
}

double json_to_double(const nlohmann::json& value, std::string_view key) {
  if (!value.is_number()) {
    throw std::invalid_argument("Expected number for field '" + std::string(key) + "'");
  }
  return value.get<double>();
}

bool json_to_bool(const nlohmann::json& value, std::string_view key) {
  if (value.is_boolean()) {
    return value.get<bool>();
  }
  if (value.is_number_integer()) {
    const int v = value.get<int>();
    if (v == 0 || v == 1) {
      return v != 0;
    }
  }
  throw std::invalid_argument("Expected bool for field '" + std::string(key) + "'");
}

std::string json_to_string(const nlohmann::json& value, std::string_view key) {
  if (!value.is_string()) {
    throw std::invalid_argument("Expected string for field '" + std::string(key) + "'");
  }
  return value.get<std::string>();
}

std::vector<std::string> json_to_string_vector(const nlohmann::json& value, std::string_view key) {
  if (!value.is_array()) {
    throw std::invalid_argument("Expected array<string> for field '" + std::string(key) + "'");
  }
  std::vector<std::string> out;
  out.reserve(value.size());
  for (const auto& element : value) {
    out.push_back(json_to_string(element, key));
  }
  return out;
}

nlohmann::json optional_double_to_json(const std::optional<double>& value) {
  if (value.has_value()) {
    return value.value();
  }
  return nullptr;
}

std::optional<double> optional_double_from(const nlohmann::json& obj, const char* key) {
  if (!has_value(obj, key)) {
    return std::nullopt;
  }
  return json_to_double(obj[key], key);
}

int int_or(const nlohmann::json& obj, const char* key, int fallback) {
  return has_value(obj, key) ? json_to_int(obj[key], key) : fallback;
}

std::string string_or(const nlohmann::json& obj, const char* key, std::string fallback) {
  return has_value(obj, key) ? json_to_string(obj[key], key) : fallback;
}

Language language_field(const nlohmann::json& obj) {
  return language_from_string(json_to_string(require_field(obj, "language"), "language"));
}

Complexity complexity_or(const nlohmann::json& obj, Complexity fallback) {
  if (!has_value(obj, "complexity")) {
    return fallback;
  }
  return complexity_from_string(json_to_string(obj["complexity"], "complexity"));
}

} // namespace

nlohmann::json to_json(const NormativeProfile& profile) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = profile.id;
  json["label"] = profile.label;
  json["language"] = to_string(profile.language);
  json["mean_wpm"] = profile.mean_wpm;
  json["sd_wpm"] = profile.sd_wpm;
  json["mean_coverage"] = profile.mean_coverage;
  json["sd_coverage"] = profile.sd_coverage;
  json["reliability_coverage"] = profile.reliability_coverage;
  return json;
}

NormativeProfile normative_profile_from_json(const nlohmann::json& json_profile) {
  NormativeProfile profile;
  profile.id = json_to_string(require_field(json_profile, "id"), "id");
  profile.label = string_or(json_profile, "label", profile.id);
  profile.language = language_field(json_profile);
  profile.mean_wpm = json_to_double(require_field(json_profile, "mean_wpm"), "mean_wpm");
  profile.sd_wpm = json_to_double(require_field(json_profile, "sd_wpm"), "sd_wpm");
  profile.mean_coverage =
      json_to_double(require_field(json_profile, "mean_coverage"), "mean_coverage");
  profile.sd_coverage = json_to_double(require_field(json_profile, "sd_coverage"), "sd_coverage");
  profile.reliability_coverage = json_to_double(
      require_field(json_profile, "reliability_coverage"), "reliability_coverage");
  return profile;
}

nlohmann::json to_json(const Keypoint& keypoint) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = keypoint.id;
  json["text"] = keypoint.text;
  json["tokens"] = keypoint.tokens;
  return json;
}

Keypoint keypoint_from_json(const nlohmann::json& json_keypoint) {
  Keypoint keypoint;
  keypoint.id = json_to_int(require_field(json_keypoint, "id"), "id");
  keypoint.text = json_to_string(require_field(json_keypoint, "text"), "text");
  if (has_value(json_keypoint, "tokens")) {
    keypoint.tokens = json_to_string_vector(json_keypoint["tokens"], "tokens");
  }
  return keypoint;
}

nlohmann::json to_json(const TestInstance& test) {
  nlohmann::json json = nlohmann::json::object();
  json["id"] = test.id;
  json["language"] = to_string(test.language);
  json["topic"] = test.topic;
  json["complexity"] = to_string(test.complexity);
  json["passage"] = test.passage;
  nlohmann::json keypoints = nlohmann::json::array();
  for (const auto& keypoint : test.keypoints) {
    keypoints.push_back(to_json(keypoint));
  }
  json["keypoints"] = std::move(keypoints);
  json["target_words"] = test.target_words;
  json["allowed_time_sec"] = test.allowed_time_sec;
  json["normative_profile_id"] = test.normative_profile_id;
  json["created_at"] = test.created_at;
  return json;
}

TestInstance test_instance_from_json(const nlohmann::json& json_test) {
  TestInstance test;
  test.id = json_to_string(require_field(json_test, "id"), "id");
  test.language = language_field(json_test);
  test.topic = string_or(json_test, "topic", "");
  test.complexity = complexity_or(json_test, Complexity::Neutral);
  test.passage = json_to_string(require_field(json_test, "passage"), "passage");
  const auto& keypoints = require_field(json_test, "keypoints");
  if (!keypoints.is_array()) {
    throw std::invalid_argument("Expected array for field 'keypoints'");
  }
  for (const auto& entry : keypoints) {
    test.keypoints.push_back(keypoint_from_json(entry));
  }
  test.target_words = int_or(json_test, "target_words", 0);
  test.allowed_time_sec = int_or(json_test, "allowed_time_sec", 0);
  test.normative_profile_id = string_or(json_test, "normative_profile_id", "");
  test.created_at = string_or(json_test, "created_at", "");
  return test;
}

nlohmann::json to_json(const KeypointResult& result) {
  nlohmann::json json = nlohmann::json::object();
  json["keypoint_id"] = result.keypoint_id;
  json["text"] = result.text;
  json["hit"] = result.hit;
  json["matched_tokens"] = result.matched_tokens;
  return json;
}

KeypointResult keypoint_result_from_json(const nlohmann::json& json_result) {
  KeypointResult result;
  result.keypoint_id = json_to_int(require_field(json_result, "keypoint_id"), "keypoint_id");
  result.text = string_or(json_result, "text", "");
  result.hit = json_to_bool(require_field(json_result, "hit"), "hit");
  if (has_value(json_result, "matched_tokens")) {
    result.matched_tokens = json_to_string_vector(json_result["matched_tokens"], "matched_tokens");
  }
  return result;
}

nlohmann::json to_json(const SessionResult& result) {
  nlohmann::json json = nlohmann::json::object();
  json["session_id"] = result.session_id;
  json["test_id"] = result.test_id;
  json["normative_profile_id"] = result.normative_profile_id;
  json["recall_text"] = result.recall_text;
  json["coverage_pct"] = result.coverage_pct;
  json["z_coverage"] = result.z_coverage;
  json["wpm_effective"] = result.wpm_effective;
  json["z_wpm"] = optional_double_to_json(result.z_wpm);
  json["rci_coverage"] = optional_double_to_json(result.rci_coverage);
  json["created_at"] = result.created_at;
  nlohmann::json keypoints = nlohmann::json::array();
  for (const auto& keypoint : result.keypoint_results) {
    keypoints.push_back(to_json(keypoint));
  }
  json["keypoint_results"] = std::move(keypoints);
  json["qualitative_label"] = result.qualitative_label;
  if (result.narrative_feedback.has_value()) {
    json["narrative_feedback"] = result.narrative_feedback.value();
  } else {
    json["narrative_feedback"] = nullptr;
  }
  return json;
}

SessionResult session_result_from_json(const nlohmann::json& json_result) {
  SessionResult result;
  result.session_id = json_to_string(require_field(json_result, "session_id"), "session_id");
  result.test_id = string_or(json_result, "test_id", "");
  result.normative_profile_id = string_or(json_result, "normative_profile_id", "");
  result.recall_text = string_or(json_result, "recall_text", "");
  result.coverage_pct = json_to_double(require_field(json_result, "coverage_pct"), "coverage_pct");
  result.z_coverage = has_value(json_result, "z_coverage")
                          ? json_to_double(json_result["z_coverage"], "z_coverage")
                          : 0.0;
  result.wpm_effective = int_or(json_result, "wpm_effective", 0);
  result.z_wpm = optional_double_from(json_result, "z_wpm");
  result.rci_coverage = optional_double_from(json_result, "rci_coverage");
  result.created_at = string_or(json_result, "created_at", "");
  if (has_value(json_result, "keypoint_results")) {
    const auto& keypoints = json_result["keypoint_results"];
    if (!keypoints.is_array()) {
      throw std::invalid_argument("Expected array for field 'keypoint_results'");
    }
    for (const auto& entry : keypoints) {
      result.keypoint_results.push_back(keypoint_result_from_json(entry));
    }
  }
  result.qualitative_label = string_or(json_result, "qualitative_label", "");
  if (has_value(json_result, "narrative_feedback")) {
    result.narrative_feedback =
        json_to_string(json_result["narrative_feedback"], "narrative_feedback");
  }
  return result;
}

nlohmann::json to_json(const TestPlan& plan) {
  nlohmann::json json = nlohmann::json::object();
  json["language"] = to_string(plan.language);
  json["topic"] = plan.topic;
  json["complexity"] = to_string(plan.complexity);
  json["target_words"] = plan.target_words;
  json["allowed_time_sec"] = plan.allowed_time_sec;
  json["normative_profile_id"] = plan.normative_profile_id;
  return json;
}

TestPlan test_plan_from_json(const nlohmann::json& json_plan) {
  TestPlan plan;
  plan.language = language_field(json_plan);
  plan.topic = string_or(json_plan, "topic", "");
  plan.complexity = complexity_or(json_plan, Complexity::Neutral);
  plan.target_words = json_to_int(require_field(json_plan, "target_words"), "target_words");
  plan.allowed_time_sec =
      json_to_int(require_field(json_plan, "allowed_time_sec"), "allowed_time_sec");
  plan.normative_profile_id = string_or(json_plan, "normative_profile_id", "");
  return plan;
}

TestConfig test_config_from_json(const nlohmann::json& json_config) {
  TestConfig config;
  if (has_value(json_config, "language")) {
    config.language = language_field(json_config);
  }
  config.topic = string_or(json_config, "topic", "");
  config.complexity = complexity_or(json_config, Complexity::Neutral);
  config.target_read_time_sec = int_or(json_config, "target_read_time_sec", config.target_read_time_sec);
  if (has_value(json_config, "use_calibrated_wpm")) {
    config.use_calibrated_wpm = json_to_bool(json_config["use_calibrated_wpm"], "use_calibrated_wpm");
  }
  config.user_calibrated_wpm = optional_double_from(json_config, "user_calibrated_wpm");
  config.normative_profile_id =
      json_to_string(require_field(json_config, "normative_profile_id"), "normative_profile_id");
  return config;
}

GeneratedContent generated_content_from_json(const nlohmann::json& json_content) {
  GeneratedContent content;
  content.passage = json_to_string(require_field(json_content, "passage"), "passage");
  content.keypoint_texts = json_to_string_vector(require_field(json_content, "keypoints"), "keypoints");
  return content;
}

} // namespace recall::bridge
