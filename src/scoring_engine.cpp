#include "recall/scoring_engine.hpp"

#include "recall/tokenizer.hpp"
#include "../scoring/scoring.hpp"
#include "debug_log.hpp"

#include <stdexcept>
#include <utility>

namespace recall {
namespace {

// Tokens stored at build time are authoritative; keypoints that arrive
// without them (hand-written or older records) are tokenized here.
std::vector<std::string> keypoint_tokens(const Keypoint& keypoint, Language language) {
  if (!keypoint.tokens.empty()) {
    return keypoint.tokens;
  }
  return tokenize_keypoint(keypoint.text, language);
}

std::optional<double> previous_coverage(const std::optional<SessionResult>& previous) {
  if (!previous.has_value()) {
    return std::nullopt;
  }
  return previous->coverage_pct;
}

std::optional<double> rounded(const std::optional<double>& value) {
  if (!value.has_value()) {
    return std::nullopt;
  }
  return scoring::round_for_report(value.value());
}

} // namespace

ScoringEngine::ScoringEngine() : ScoringEngine(resources::build_builtin_profile_catalog()) {}

ScoringEngine::ScoringEngine(resources::ProfileCatalog catalog)
    : ScoringEngine(std::move(catalog), make_random_id_generator(), make_system_clock()) {}

ScoringEngine::ScoringEngine(resources::ProfileCatalog catalog, std::shared_ptr<IdGenerator> ids,
                             std::shared_ptr<Clock> clock)
    : catalog_(std::move(catalog)), ids_(std::move(ids)), clock_(std::move(clock)) {
  if (!ids_) {
    throw std::invalid_argument("ScoringEngine requires an id generator");
  }
  if (!clock_) {
    throw std::invalid_argument("ScoringEngine requires a clock");
  }
}

SessionResult ScoringEngine::score_session(const TestInstance& test, const std::string& recall_text,
                                           double elapsed_time_sec,
                                           const std::optional<SessionResult>& previous_session) const {
  const auto recall_tokens = tokenize(recall_text, test.language);

  std::vector<KeypointResult> keypoint_results;
  keypoint_results.reserve(test.keypoints.size());
  for (const auto& keypoint : test.keypoints) {
    const auto match = scoring::evaluate_keypoint(recall_tokens, keypoint_tokens(keypoint, test.language));
    if (match.degenerate) {
      detail::debug_log("scoring", "test " + test.id + ": keypoint " +
                                       std::to_string(keypoint.id) + " has no tokens");
    }
    KeypointResult result;
    result.keypoint_id = keypoint.id;
    result.text = keypoint.text;
    result.hit = match.hit;
    result.matched_tokens = match.matched;
    keypoint_results.push_back(std::move(result));
  }
  if (keypoint_results.empty()) {
    detail::debug_log("scoring", "test " + test.id + " has no keypoints; coverage is 0");
  }

  const double coverage_pct = scoring::coverage_percent(keypoint_results);
  const std::size_t word_count = raw_word_count(test.passage);
  if (word_count == 0) {
    detail::debug_log("scoring", "test " + test.id + " has an empty passage; wpm is 0");
  }
  const int wpm = scoring::effective_wpm(word_count, elapsed_time_sec);

  const scoring::NormativeScorer scorer(catalog_.lookup(test.normative_profile_id));
  if (!scorer.has_profile()) {
    detail::debug_log("scoring", "normative profile '" + test.normative_profile_id +
                                     "' not found; standardized scores omitted");
  }
  const auto normative = scorer.score(coverage_pct, wpm);
  const auto rci = scorer.reliable_change(coverage_pct, previous_coverage(previous_session));

  SessionResult result;
  result.session_id = ids_->next_id();
  result.test_id = test.id;
  result.normative_profile_id = test.normative_profile_id;
  result.recall_text = recall_text;
  result.coverage_pct = coverage_pct;
  result.z_coverage = scoring::round_for_report(normative.z_coverage);
  result.wpm_effective = wpm;
  result.z_wpm = rounded(normative.z_wpm);
  result.rci_coverage = rounded(rci);
  result.created_at = clock_->now_iso8601();
  result.keypoint_results = std::move(keypoint_results);
  result.qualitative_label = normative.label;
  return result;
}

} // namespace recall
