#pragma once

#include "recall/test_builder.hpp"
#include "recall/types.hpp"

#include <string>
#include <vector>

namespace recall {

// External text generation service. Must return as many keypoints as the
// caller asked the model for; the engine accepts whatever count it gets.
class ContentGenerator {
public:
  virtual ~ContentGenerator() = default;
  virtual GeneratedContent generate(const std::string& topic, Language language,
                                    Complexity complexity, int target_words) = 0;
};

// Cleans up speech-to-text output before scoring.
class TextRefiner {
public:
  virtual ~TextRefiner() = default;
  virtual std::string refine(const std::string& raw_text) = 0;
};

// Produces the short qualitative narrative shown next to the scores.
class NarrativeAnalyzer {
public:
  virtual ~NarrativeAnalyzer() = default;
  virtual std::string analyze(const std::string& passage, const std::string& recall_text,
                              const std::vector<std::string>& keypoint_texts) = 0;
};

// Returns `raw_text` unchanged when the refiner fails.
std::string refine_recall(TextRefiner& refiner, const std::string& raw_text);

// Copy of `result` with narrative_feedback filled in. A failing analyzer
// leaves the field empty; the numeric result stays valid.
SessionResult attach_narrative(const SessionResult& result, const TestInstance& test,
                               NarrativeAnalyzer& analyzer);

} // namespace recall
