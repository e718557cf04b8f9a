#include "recall/identity.hpp"

#include "rng.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace recall {

RandomIdGenerator::RandomIdGenerator(std::uint64_t seed)
    : state_(seed == 0 ? device_seed() : seed) {}

std::string RandomIdGenerator::next_id() {
  std::lock_guard<std::mutex> lock(mutex_);
  return uuid_v4(state_);
}

std::string SystemClock::now_iso8601() {
  return format_iso8601(std::chrono::system_clock::now());
}

std::string format_iso8601(std::chrono::system_clock::time_point instant) {
  using namespace std::chrono;
  const auto since_epoch = duration_cast<milliseconds>(instant.time_since_epoch());
  auto seconds_part = duration_cast<seconds>(since_epoch);
  auto millis = since_epoch - duration_cast<milliseconds>(seconds_part);
  if (millis.count() < 0) {
    millis += seconds(1);
    seconds_part -= seconds(1);
  }

  const std::time_t raw = static_cast<std::time_t>(seconds_part.count());
  std::tm utc{};
#if defined(_WIN32)
  gmtime_s(&utc, &raw);
#else
  gmtime_r(&raw, &utc);
#endif

  std::ostringstream oss;
  oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.';
  oss.width(3);
  oss.fill('0');
  oss << millis.count() << 'Z';
  return oss.str();
}

std::shared_ptr<IdGenerator> make_random_id_generator() {
  return std::make_shared<RandomIdGenerator>();
}

std::shared_ptr<Clock> make_system_clock() {
  return std::make_shared<SystemClock>();
}

} // namespace recall
