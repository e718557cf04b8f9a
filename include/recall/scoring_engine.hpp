#pragma once

#include "recall/identity.hpp"
#include "recall/types.hpp"
#include "resources/normative_profiles.hpp"

#include <memory>
#include <optional>
#include <string>

namespace recall {

/**
 * Turns a recall attempt into a SessionResult. Scoring is a pure function of
 * its arguments and the profile catalog; only the session id and timestamp
 * come from the injected generator and clock. The engine keeps no history;
 * callers pass the previous session (usually the store's latest) explicitly.
 *
 * Never throws for any test or text: degenerate tests score 0 coverage and
 * 0 wpm, and an unknown profile yields the "normative data unavailable" label
 * with z_coverage 0 and no z_wpm or rci_coverage.
 */
class ScoringEngine {
public:
  ScoringEngine();
  explicit ScoringEngine(resources::ProfileCatalog catalog);
  ScoringEngine(resources::ProfileCatalog catalog, std::shared_ptr<IdGenerator> ids,
                std::shared_ptr<Clock> clock);

  const resources::ProfileCatalog& catalog() const noexcept { return catalog_; }

  SessionResult score_session(const TestInstance& test, const std::string& recall_text,
                              double elapsed_time_sec,
                              const std::optional<SessionResult>& previous_session = std::nullopt) const;

private:
  resources::ProfileCatalog catalog_;
  std::shared_ptr<IdGenerator> ids_;
  std::shared_ptr<Clock> clock_;
};

} // namespace recall
