#include "recall/services.hpp"

#include "debug_log.hpp"

#include <exception>

namespace recall {

std::string refine_recall(TextRefiner& refiner, const std::string& raw_text) {
  try {
    return refiner.refine(raw_text);
  } catch (const std::exception& e) {
    detail::debug_log("refiner", std::string("keeping raw recall text: ") + e.what());
    return raw_text;
  }
}

SessionResult attach_narrative(const SessionResult& result, const TestInstance& test,
                               NarrativeAnalyzer& analyzer) {
  std::vector<std::string> keypoint_texts;
  keypoint_texts.reserve(test.keypoints.size());
  for (const auto& keypoint : test.keypoints) {
    keypoint_texts.push_back(keypoint.text);
  }

  SessionResult annotated = result;
  try {
    annotated.narrative_feedback = analyzer.analyze(test.passage, result.recall_text, keypoint_texts);
  } catch (const std::exception& e) {
    detail::debug_log("narrative", std::string("analysis unavailable: ") + e.what());
    annotated.narrative_feedback.reset();
  }
  return annotated;
}

} // namespace recall
