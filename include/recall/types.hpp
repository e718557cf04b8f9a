#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace recall {

enum class Language {
  PtBR,
  EnUS,
  EsES
};

inline std::string to_string(Language language) {
  switch (language) {
    case Language::PtBR: return "pt-BR";
    case Language::EnUS: return "en-US";
    case Language::EsES: return "es-ES";
  }
  return "pt-BR";
}

inline Language language_from_string(const std::string& value) {
  if (value == "pt-BR") {
    return Language::PtBR;
  }
  if (value == "en-US") {
    return Language::EnUS;
  }
  if (value == "es-ES") {
    return Language::EsES;
  }
  throw std::invalid_argument("Unknown language: " + value);
}

enum class Complexity {
  Neutral,
  Dense
};

inline std::string to_string(Complexity complexity) {
  switch (complexity) {
    case Complexity::Neutral: return "neutral";
    case Complexity::Dense: return "dense";
  }
  return "neutral";
}

inline Complexity complexity_from_string(const std::string& value) {
  if (value == "neutral") {
    return Complexity::Neutral;
  }
  if (value == "dense") {
    return Complexity::Dense;
  }
  throw std::invalid_argument("Unknown complexity: " + value);
}

// Reference population for standardizing coverage and reading speed.
// Coverage figures are percentage points (0-100).
struct NormativeProfile {
  std::string id;
  std::string label;
  Language language = Language::PtBR;
  double mean_wpm = 0.0;
  double sd_wpm = 0.0;
  double mean_coverage = 0.0;
  double sd_coverage = 0.0;
  double reliability_coverage = 0.0;

  // Throws std::invalid_argument unless both SDs are positive, the
  // reliability lies strictly inside (0, 1) and every figure is finite.
  void validate() const;
};

struct Keypoint {
  int id = 0;
  std::string text;
  std::vector<std::string> tokens;
};

struct TestInstance {
  std::string id;
  Language language = Language::PtBR;
  std::string topic;
  Complexity complexity = Complexity::Neutral;
  std::string passage;
  std::vector<Keypoint> keypoints;
  int target_words = 0;
  int allowed_time_sec = 0;
  std::string normative_profile_id;
  std::string created_at;
};

struct KeypointResult {
  int keypoint_id = 0;
  std::string text;
  bool hit = false;
  std::vector<std::string> matched_tokens;
};

struct SessionResult {
  std::string session_id;
  std::string test_id;
  std::string normative_profile_id;
  std::string recall_text;
  double coverage_pct = 0.0;
  double z_coverage = 0.0;
  int wpm_effective = 0;
  std::optional<double> z_wpm;
  std::optional<double> rci_coverage;
  std::string created_at;
  std::vector<KeypointResult> keypoint_results;
  std::string qualitative_label;
  std::optional<std::string> narrative_feedback;
};

} // namespace recall
