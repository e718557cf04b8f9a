#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace recall {

class IdGenerator {
public:
  virtual ~IdGenerator() = default;
  virtual std::string next_id() = 0;
};

class Clock {
public:
  virtual ~Clock() = default;
  // Current instant as ISO-8601 UTC with milliseconds, e.g. 2024-05-01T12:30:00.250Z.
  virtual std::string now_iso8601() = 0;
};

// Random RFC 4122 v4 identifiers. A zero seed draws one from std::random_device.
class RandomIdGenerator : public IdGenerator {
public:
  explicit RandomIdGenerator(std::uint64_t seed = 0);

  std::string next_id() override;

private:
  std::mutex mutex_;
  std::uint64_t state_;
};

class SystemClock : public Clock {
public:
  std::string now_iso8601() override;
};

std::string format_iso8601(std::chrono::system_clock::time_point instant);

std::shared_ptr<IdGenerator> make_random_id_generator();
std::shared_ptr<Clock> make_system_clock();

} // namespace recall
