#pragma once

#include "recall/types.hpp"
#include "resources/normative_profiles.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace recall::scoring {

// Policy constants. Their values are behavioral contracts of the scoring
// pipeline; none has a statistical derivation behind it.
constexpr double kHitRatioThreshold = 0.35;
constexpr std::size_t kHitDistinctAnchors = 2;
constexpr double kMinElapsedSeconds = 5.0;
constexpr double kWithinRangeCut = -1.0;
constexpr double kMildlyReducedCut = -2.0;
constexpr double kReliableChangeCut = 1.96;

inline const char* const kLabelWithinRange = "within expected range";
inline const char* const kLabelMildlyReduced = "mildly reduced";
inline const char* const kLabelBelowRange = "below expected range";
inline const char* const kLabelUnavailable = "normative data unavailable";

// Two decimals, half away from zero.
double round_for_report(double value);

struct KeypointMatch {
  bool hit = false;
  double coverage_ratio = 0.0;
  std::vector<std::string> matched;
  // Keypoint without any significant token; can only hit through anchors,
  // which it cannot have either.
  bool degenerate = false;
};

/**
 * Decides whether a keypoint was recalled. The ratio numerator counts every
 * keypoint token (repeats included) that occurs anywhere in the recall;
 * `matched` lists distinct shared tokens in keypoint order. A hit needs
 * ratio >= 0.35 or at least two distinct shared tokens.
 */
KeypointMatch evaluate_keypoint(const std::vector<std::string>& recall_tokens,
                                const std::vector<std::string>& keypoint_tokens);

// 100 * hits / keypoints; 0 when there are no keypoints.
double coverage_percent(const std::vector<KeypointResult>& results);

// round(words / max(elapsed, 5) * 60). Non-finite elapsed times use the floor.
// Saturates at INT_MAX.
int effective_wpm(std::size_t word_count, double elapsed_time_sec);

std::string qualitative_label(double z_coverage);

// sd_coverage * sqrt(2 * (1 - reliability)).
double difference_standard_error(const NormativeProfile& profile);

double reliable_change(const NormativeProfile& profile, double current_coverage_pct,
                       double previous_coverage_pct);

// |rci| above 1.96: reliable change at roughly 95% confidence.
bool is_reliable_change(double rci);

struct NormativeScore {
  double z_coverage = 0.0;
  std::optional<double> z_wpm;
  std::string label;
};

class NormativeScorer {
public:
  explicit NormativeScorer(resources::ProfileLookup lookup);

  bool has_profile() const noexcept { return lookup_.is_resolved(); }

  // Full precision; callers round for reporting.
  NormativeScore score(double coverage_pct, int wpm_effective) const;

  // Empty unless both a profile and a previous coverage exist.
  std::optional<double> reliable_change(double coverage_pct,
                                        std::optional<double> previous_coverage_pct) const;

private:
  resources::ProfileLookup lookup_;
};

} // namespace recall::scoring
