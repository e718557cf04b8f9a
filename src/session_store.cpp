#include "recall/session_store.hpp"

#include "debug_log.hpp"
#include "json_bridge.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <nlohmann/json.hpp>

namespace recall {
namespace {

// Shortest text that reads back to the same double, as in 50.0, -1.5 or
// 33.333333333333336.
std::string format_number(double value) {
  return nlohmann::json(value).dump();
}

// Raw history array. Entries are not decoded here so that records this
// build cannot read survive a rewrite.
nlohmann::json read_history_document(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return nlohmann::json::array();
  }
  std::ifstream stream(path);
  if (!stream) {
    detail::debug_log("store", "cannot open " + path.string() + "; treating history as empty");
    return nlohmann::json::array();
  }
  std::string content((std::istreambuf_iterator<char>(stream)), std::istreambuf_iterator<char>());
  try {
    auto document = nlohmann::json::parse(content);
    if (!document.is_array()) {
      detail::debug_log("store", path.string() + " is not a JSON array; treating history as empty");
      return nlohmann::json::array();
    }
    return document;
  } catch (const nlohmann::json::parse_error& e) {
    detail::debug_log("store", "failed to parse " + path.string() + ": " + e.what());
    return nlohmann::json::array();
  }
}

void write_history_document(const std::filesystem::path& path, const nlohmann::json& document) {
  if (path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("Failed to create history directory " +
                               path.parent_path().string() + ": " + ec.message());
    }
  }

  // Invalid UTF-8 in free text is written as U+FFFD.
  const std::string text =
      document.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);

  auto temp = path;
  temp += ".tmp";
  {
    std::ofstream stream(temp, std::ios::trunc);
    if (!stream) {
      throw std::runtime_error("Failed to open session history for writing: " + temp.string());
    }
    stream << text;
    if (!stream) {
      throw std::runtime_error("Failed to write session history: " + temp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(temp, path, ec);
  if (ec) {
    throw std::runtime_error("Failed to replace session history " + path.string() + ": " +
                             ec.message());
  }
}

std::string csv_field(const std::string& value) {
  if (value.find_first_of(",\"\n\r") == std::string::npos) {
    return value;
  }
  std::string quoted = "\"";
  for (char c : value) {
    if (c == '"') {
      quoted.push_back('"');
    }
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

} // namespace

void InMemorySessionStore::save(const SessionResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.insert(sessions_.begin(), result);
}

std::vector<SessionResult> InMemorySessionStore::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_;
}

std::optional<SessionResult> InMemorySessionStore::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions_.empty()) {
    return std::nullopt;
  }
  return sessions_.front();
}

void InMemorySessionStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  sessions_.clear();
}

JsonFileSessionStore::JsonFileSessionStore(std::filesystem::path path) : path_(std::move(path)) {
  if (path_.empty()) {
    throw std::invalid_argument("JsonFileSessionStore requires a file path");
  }
}

std::vector<SessionResult> JsonFileSessionStore::decode_locked() const {
  const auto document = read_history_document(path_);
  std::vector<SessionResult> sessions;
  sessions.reserve(document.size());
  std::size_t index = 0;
  for (const auto& entry : document) {
    try {
      sessions.push_back(bridge::session_result_from_json(entry));
    } catch (const std::exception& e) {
      detail::debug_log("store", "skipping history entry " + std::to_string(index) + " in " +
                                     path_.string() + ": " + e.what());
    }
    ++index;
  }
  return sessions;
}

void JsonFileSessionStore::save(const SessionResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto document = read_history_document(path_);
  document.insert(document.begin(), bridge::to_json(result));
  write_history_document(path_, document);
}

std::vector<SessionResult> JsonFileSessionStore::list_all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return decode_locked();
}

std::optional<SessionResult> JsonFileSessionStore::latest() const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto sessions = decode_locked();
  if (sessions.empty()) {
    return std::nullopt;
  }
  return std::move(sessions.front());
}

void JsonFileSessionStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::error_code ec;
  std::filesystem::remove(path_, ec);
  if (ec) {
    throw std::runtime_error("Failed to clear session history " + path_.string() + ": " +
                             ec.message());
  }
}

std::string history_csv(const std::vector<SessionResult>& sessions) {
  std::ostringstream out;
  out << "Date,Coverage,Z-Score,WPM,Test\n";
  for (const auto& session : sessions) {
    out << csv_field(session.created_at) << ',' << format_number(session.coverage_pct) << ','
        << format_number(session.z_coverage) << ',' << session.wpm_effective << ','
        << csv_field(session.test_id) << '\n';
  }
  return out.str();
}

} // namespace recall
