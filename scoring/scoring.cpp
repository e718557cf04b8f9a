#include "scoring.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <utility>

namespace recall::scoring {

double round_for_report(double value) {
  return std::round(value * 100.0) / 100.0;
}

KeypointMatch evaluate_keypoint(const std::vector<std::string>& recall_tokens,
                                const std::vector<std::string>& keypoint_tokens) {
  KeypointMatch match;
  if (keypoint_tokens.empty()) {
    match.degenerate = true;
    return match;
  }

  const auto in_recall = [&](const std::string& token) {
    return std::find(recall_tokens.begin(), recall_tokens.end(), token) != recall_tokens.end();
  };

  std::size_t found = 0;
  for (const auto& token : keypoint_tokens) {
    if (!in_recall(token)) {
      continue;
    }
    ++found;
    if (std::find(match.matched.begin(), match.matched.end(), token) == match.matched.end()) {
      match.matched.push_back(token);
    }
  }

  match.coverage_ratio =
      static_cast<double>(found) / static_cast<double>(keypoint_tokens.size());
  match.hit = match.coverage_ratio >= kHitRatioThreshold ||
              match.matched.size() >= kHitDistinctAnchors;
  return match;
}

double coverage_percent(const std::vector<KeypointResult>& results) {
  if (results.empty()) {
    return 0.0;
  }
  const auto hits = std::count_if(results.begin(), results.end(),
                                  [](const KeypointResult& r) { return r.hit; });
  return static_cast<double>(hits) / static_cast<double>(results.size()) * 100.0;
}

int effective_wpm(std::size_t word_count, double elapsed_time_sec) {
  if (word_count == 0) {
    return 0;
  }
  double safe_time = kMinElapsedSeconds;
  if (std::isfinite(elapsed_time_sec) && elapsed_time_sec > kMinElapsedSeconds) {
    safe_time = elapsed_time_sec;
  }
  const double wpm = std::floor(static_cast<double>(word_count) / safe_time * 60.0 + 0.5);
  constexpr int kMaxWpm = std::numeric_limits<int>::max();
  if (wpm >= static_cast<double>(kMaxWpm)) {
    return kMaxWpm;
  }
  return static_cast<int>(wpm);
}

std::string qualitative_label(double z_coverage) {
  if (z_coverage >= kWithinRangeCut) {
    return kLabelWithinRange;
  }
  if (z_coverage >= kMildlyReducedCut) {
    return kLabelMildlyReduced;
  }
  return kLabelBelowRange;
}

double difference_standard_error(const NormativeProfile& profile) {
  return profile.sd_coverage * std::sqrt(2.0 * (1.0 - profile.reliability_coverage));
}

double reliable_change(const NormativeProfile& profile, double current_coverage_pct,
                       double previous_coverage_pct) {
  return (current_coverage_pct - previous_coverage_pct) / difference_standard_error(profile);
}

bool is_reliable_change(double rci) {
  return std::abs(rci) > kReliableChangeCut;
}

NormativeScorer::NormativeScorer(resources::ProfileLookup lookup) : lookup_(std::move(lookup)) {}

NormativeScore NormativeScorer::score(double coverage_pct, int wpm_effective) const {
  NormativeScore result;
  if (!lookup_.is_resolved()) {
    result.label = kLabelUnavailable;
    return result;
  }
  const auto& profile = lookup_.profile();
  result.z_coverage = (coverage_pct - profile.mean_coverage) / profile.sd_coverage;
  result.z_wpm = (static_cast<double>(wpm_effective) - profile.mean_wpm) / profile.sd_wpm;
  result.label = qualitative_label(result.z_coverage);
  return result;
}

std::optional<double> NormativeScorer::reliable_change(
    double coverage_pct, std::optional<double> previous_coverage_pct) const {
  if (!lookup_.is_resolved() || !previous_coverage_pct.has_value()) {
    return std::nullopt;
  }
  return scoring::reliable_change(lookup_.profile(), coverage_pct, previous_coverage_pct.value());
}

} // namespace recall::scoring
