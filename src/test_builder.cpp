#include "recall/test_builder.hpp"

#include "recall/services.hpp"
#include "recall/tokenizer.hpp"
#include "resources/default_topics.hpp"
#include "debug_log.hpp"
#include "rng.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace recall {
namespace {

// Half-up rounding used for every word-count figure.
int round_half_up(double value) {
  return static_cast<int>(std::floor(value + 0.5));
}

double base_wpm_for(const TestConfig& config, const NormativeProfile* profile) {
  if (config.use_calibrated_wpm && config.user_calibrated_wpm.has_value()) {
    const double calibrated = config.user_calibrated_wpm.value();
    if (std::isfinite(calibrated) && calibrated > 0.0) {
      return calibrated;
    }
  }
  if (profile) {
    return profile->mean_wpm;
  }
  throw std::invalid_argument("plan_test: unknown profile '" + config.normative_profile_id +
                              "' and no calibrated reading speed");
}

} // namespace

TestPlan plan_test(const TestConfig& config, const resources::ProfileCatalog& catalog) {
  if (config.target_read_time_sec <= 0) {
    throw std::invalid_argument("plan_test: target_read_time_sec must be positive");
  }
  const auto* profile = catalog.find(config.normative_profile_id);
  const double base_wpm = base_wpm_for(config, profile);
  const double adjusted_wpm = config.complexity == Complexity::Dense
                                  ? static_cast<double>(round_half_up(base_wpm * kDenseSpeedFactor))
                                  : base_wpm;

  TestPlan plan;
  plan.language = config.language.value_or(profile ? profile->language : Language::PtBR);
  plan.topic = config.topic;
  plan.complexity = config.complexity;
  plan.target_words =
      round_half_up(static_cast<double>(config.target_read_time_sec) / 60.0 * adjusted_wpm);
  plan.allowed_time_sec = config.target_read_time_sec;
  plan.normative_profile_id = config.normative_profile_id;
  return plan;
}

TestInstance build_test_instance(const TestPlan& plan, const GeneratedContent& content,
                                 IdGenerator& ids, Clock& clock) {
  if (content.keypoint_texts.empty()) {
    throw std::invalid_argument("build_test_instance: generated content has no keypoints");
  }

  TestInstance test;
  test.id = ids.next_id();
  test.language = plan.language;
  test.topic = plan.topic;
  test.complexity = plan.complexity;
  test.passage = content.passage;
  test.target_words = plan.target_words;
  test.allowed_time_sec = plan.allowed_time_sec;
  test.normative_profile_id = plan.normative_profile_id;
  test.created_at = clock.now_iso8601();

  test.keypoints.reserve(content.keypoint_texts.size());
  for (std::size_t i = 0; i < content.keypoint_texts.size(); ++i) {
    Keypoint keypoint;
    keypoint.id = static_cast<int>(i);
    keypoint.text = content.keypoint_texts[i];
    keypoint.tokens = tokenize_keypoint(keypoint.text, plan.language);
    if (keypoint.tokens.empty()) {
      detail::debug_log("builder", "keypoint " + std::to_string(i) +
                                       " has no significant tokens and can never be hit");
    }
    test.keypoints.push_back(std::move(keypoint));
  }
  return test;
}

TestInstance generate_test(const TestPlan& plan, ContentGenerator& generator,
                           IdGenerator& ids, Clock& clock) {
  const auto content =
      generator.generate(plan.topic, plan.language, plan.complexity, plan.target_words);
  return build_test_instance(plan, content, ids, clock);
}

std::string pick_topic(std::uint64_t& rng_state) {
  const auto& topics = resources::default_topics();
  return topics[rand_index(rng_state, topics.size())];
}

Complexity pick_complexity(std::uint64_t& rng_state) {
  return rand_unit(rng_state) > 0.5 ? Complexity::Neutral : Complexity::Dense;
}

int finalize_elapsed(int allowed_time_sec, long long elapsed_ms, bool time_expired) {
  if (time_expired) {
    return allowed_time_sec;
  }
  if (elapsed_ms <= 0) {
    return 0;
  }
  return static_cast<int>(elapsed_ms / 1000);
}

} // namespace recall
