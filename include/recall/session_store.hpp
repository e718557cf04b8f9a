#pragma once

#include "recall/types.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace recall {

/**
 * Append-only history of scored sessions, newest first. The scoring engine
 * never writes here; callers save each result and read `latest()` as the
 * previous session for the next attempt.
 */
class SessionStore {
public:
  virtual ~SessionStore() = default;

  virtual void save(const SessionResult& result) = 0;
  virtual std::vector<SessionResult> list_all() const = 0;
  virtual std::optional<SessionResult> latest() const = 0;
  virtual void clear() = 0;
};

class InMemorySessionStore : public SessionStore {
public:
  void save(const SessionResult& result) override;
  std::vector<SessionResult> list_all() const override;
  std::optional<SessionResult> latest() const override;
  void clear() override;

private:
  mutable std::mutex mutex_;
  std::vector<SessionResult> sessions_;
};

// History kept as a JSON array file. A missing file, or one that is not a JSON
// array, reads as an empty history. Entries that do not decode are skipped when
// listing but kept in the file by `save`. Failing to write throws
// std::runtime_error.
class JsonFileSessionStore : public SessionStore {
public:
  explicit JsonFileSessionStore(std::filesystem::path path);

  const std::filesystem::path& path() const noexcept { return path_; }

  void save(const SessionResult& result) override;
  std::vector<SessionResult> list_all() const override;
  std::optional<SessionResult> latest() const override;
  void clear() override;

private:
  std::vector<SessionResult> decode_locked() const;

  std::filesystem::path path_;
  mutable std::mutex mutex_;
};

// "Date,Coverage,Z-Score,WPM,Test" followed by one line per session.
std::string history_csv(const std::vector<SessionResult>& sessions);

} // namespace recall
