#include "RecallBridge.h"

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "recall/scoring_engine.hpp"
#include "recall/session_store.hpp"
#include "recall/test_builder.hpp"
#include "recall/tokenizer.hpp"
#include "../../src/json_bridge.hpp"
#include "../../src/rng.hpp"

namespace {

constexpr const char* kHistoryFileName = "recall_sessions.json";

struct BridgeState {
  std::mutex mutex;
  std::unique_ptr<recall::ScoringEngine> engine;
  std::unique_ptr<recall::SessionStore> store;
  std::shared_ptr<recall::IdGenerator> ids = recall::make_random_id_generator();
  std::shared_ptr<recall::Clock> clock = recall::make_system_clock();
  std::uint64_t rng_state = recall::device_seed();
};

BridgeState& state() {
  static BridgeState instance;
  return instance;
}

recall::ScoringEngine& ensure_engine(BridgeState& s) {
  if (!s.engine) {
    s.engine = std::make_unique<recall::ScoringEngine>(
        recall::resources::build_builtin_profile_catalog(), s.ids, s.clock);
  }
  return *s.engine;
}

recall::SessionStore& ensure_store(BridgeState& s) {
  if (!s.store) {
    s.store = std::make_unique<recall::InMemorySessionStore>();
  }
  return *s.store;
}

char* copy_string(const std::string& value) {
  char* buffer = static_cast<char*>(std::malloc(value.size() + 1));
  if (!buffer) {
    return nullptr;
  }
  std::memcpy(buffer, value.c_str(), value.size());
  buffer[value.size()] = '\0';
  return buffer;
}

// Recall text is arbitrary bytes; invalid UTF-8 goes out as U+FFFD.
char* copy_json(const nlohmann::json& json) {
  return copy_string(json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

nlohmann::json ok_envelope() {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  return payload;
}

nlohmann::json error_envelope(const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["message"] = message;
  return payload;
}

nlohmann::json parse_argument(const char* json, const char* what) {
  if (!json) {
    throw std::invalid_argument(std::string("Missing ") + what);
  }
  return nlohmann::json::parse(json);
}

} // namespace

extern "C" {

char* recall_set_storage_root(const char* path) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    if (!path || std::strlen(path) == 0) {
      s.store = std::make_unique<recall::InMemorySessionStore>();
      return copy_json(ok_envelope());
    }
    std::filesystem::path root(path);
    std::filesystem::create_directories(root);
    s.store = std::make_unique<recall::JsonFileSessionStore>(root / kHistoryFileName);
    return copy_json(ok_envelope());
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* recall_load_profiles(const char* catalog_path) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    if (!catalog_path) {
      throw std::invalid_argument("Missing profile catalog path");
    }
    auto catalog = recall::resources::load_profile_catalog(catalog_path);
    s.engine = std::make_unique<recall::ScoringEngine>(std::move(catalog), s.ids, s.clock);
    nlohmann::json payload = ok_envelope();
    payload["count"] = s.engine->catalog().size();
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* recall_list_profiles(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    nlohmann::json profiles = nlohmann::json::array();
    for (const auto& profile : ensure_engine(s).catalog().profiles()) {
      profiles.push_back(recall::bridge::to_json(profile));
    }
    nlohmann::json payload = ok_envelope();
    payload["profiles"] = std::move(profiles);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* recall_plan_test(const char* config_json) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    const auto json_config = parse_argument(config_json, "test config json");
    auto config = recall::bridge::test_config_from_json(json_config);
    if (!json_config.contains("complexity") || json_config["complexity"].is_null()) {
      config.complexity = recall::pick_complexity(s.rng_state);
    }
    if (config.topic.empty()) {
      config.topic = recall::pick_topic(s.rng_state);
    }
    const auto plan = recall::plan_test(config, ensure_engine(s).catalog());
    nlohmann::json payload = ok_envelope();
    payload["plan"] = recall::bridge::to_json(plan);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* recall_build_test(const char* plan_json, const char* content_json) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    const auto plan = recall::bridge::test_plan_from_json(parse_argument(plan_json, "test plan json"));
    const auto content = recall::bridge::generated_content_from_json(
        parse_argument(content_json, "generated content json"));
    const auto test = recall::build_test_instance(plan, content, *s.ids, *s.clock);
    nlohmann::json payload = ok_envelope();
    payload["test"] = recall::bridge::to_json(test);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* recall_tokenize(const char* text, const char* language) {
  try {
    const auto lang = recall::language_from_string(language ? language : "pt-BR");
    nlohmann::json payload = ok_envelope();
    payload["tokens"] = recall::tokenize(text ? text : "", lang);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

// Request: {"test": {...}, "recall_text": "...", "elapsed_time_sec": 42,
//           "previous": {...} | null, "save": true}
// Without a "previous" key the store's latest session is used.
char* recall_score_session(const char* request_json) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    const auto request = parse_argument(request_json, "score request json");
    if (!request.is_object() || !request.contains("test")) {
      throw std::invalid_argument("Score request must contain 'test'");
    }
    const auto test = recall::bridge::test_instance_from_json(request["test"]);
    const std::string recall_text = request.value("recall_text", std::string());
    const double elapsed = request.value("elapsed_time_sec", 0.0);
    const bool save = request.value("save", true);

    auto& store = ensure_store(s);
    std::optional<recall::SessionResult> previous;
    if (request.contains("previous")) {
      if (!request["previous"].is_null()) {
        previous = recall::bridge::session_result_from_json(request["previous"]);
      }
    } else {
      previous = store.latest();
    }

    const auto result = ensure_engine(s).score_session(test, recall_text, elapsed, previous);
    if (save) {
      store.save(result);
    }
    nlohmann::json payload = ok_envelope();
    payload["result"] = recall::bridge::to_json(result);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* recall_history(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    const auto sessions = ensure_store(s).list_all();
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& session : sessions) {
      entries.push_back(recall::bridge::to_json(session));
    }
    nlohmann::json payload = ok_envelope();
    payload["sessions"] = std::move(entries);
    payload["csv"] = recall::history_csv(sessions);
    return copy_json(payload);
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

char* recall_clear_history(void) {
  auto& s = state();
  std::scoped_lock guard(s.mutex);
  try {
    ensure_store(s).clear();
    return copy_json(ok_envelope());
  } catch (const std::exception& ex) {
    return copy_json(error_envelope(ex.what()));
  }
}

void recall_free_string(char* ptr) {
  if (ptr != nullptr) {
    std::free(ptr);
  }
}

} // extern "C"
