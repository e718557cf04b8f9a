#include "../include/recall/session_store.hpp"
#include "../include/recall/types.hpp"
#include "../src/json_bridge.hpp"
#include "../src/rng.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

recall::SessionResult make_session(const std::string& id, double coverage) {
  recall::SessionResult session;
  session.session_id = id;
  session.test_id = "test-" + id;
  session.normative_profile_id = "adult_pt_br_general";
  session.recall_text = "Lembrei do sono e da memória.";
  session.coverage_pct = coverage;
  session.z_coverage = (coverage - 65.0) / 15.0;
  session.wpm_effective = 150;
  session.z_wpm = -1.0;
  session.created_at = "2024-01-0" + id + "T09:00:00.000Z";
  session.keypoint_results = {{0, "O sono consolida memórias", true, {"sono", "memorias"}},
                              {1, "Atenção sustentada", false, {}}};
  session.qualitative_label = "within expected range";
  return session;
}

std::filesystem::path scratch_dir() {
  std::uint64_t seed = recall::device_seed();
  auto dir = std::filesystem::temp_directory_path() /
             ("recall_store_test_" + recall::uuid_v4(seed));
  std::filesystem::create_directories(dir);
  return dir;
}

void test_in_memory_store(TestSuite& suite) {
  recall::InMemorySessionStore store;
  suite.require(store.list_all().empty(), "new store is empty");
  suite.require(!store.latest().has_value(), "new store has no latest session");

  store.save(make_session("1", 50.0));
  store.save(make_session("2", 80.0));
  const auto sessions = store.list_all();
  suite.require(sessions.size() == 2, "two saved sessions");
  suite.require(sessions[0].session_id == "2" && sessions[1].session_id == "1",
                "history is newest first");
  suite.require(store.latest().has_value() && store.latest()->coverage_pct == 80.0,
                "latest is the most recent save");

  store.clear();
  suite.require(store.list_all().empty() && !store.latest().has_value(), "clear empties history");
}

void test_json_file_store(TestSuite& suite) {
  const auto dir = scratch_dir();
  const auto path = dir / "nested" / "sessions.json";

  {
    recall::JsonFileSessionStore store(path);
    suite.require(store.list_all().empty(), "missing file reads as empty history");
    auto first = make_session("1", 50.0);
    first.z_wpm.reset();
    store.save(first);
    auto second = make_session("2", 80.0);
    second.rci_coverage = 0.0;
    second.narrative_feedback = "Boa evolução.";
    store.save(second);
    suite.require(std::filesystem::exists(path), "history file is created");
  }

  {
    recall::JsonFileSessionStore reopened(path);
    const auto sessions = reopened.list_all();
    suite.require(sessions.size() == 2, "history survives reopening");
    if (sessions.size() == 2) {
      suite.require(sessions[0].session_id == "2", "newest first after reopening");
      suite.require(sessions[0].rci_coverage.has_value() && *sessions[0].rci_coverage == 0.0,
                    "rci of 0 is kept as a value");
      suite.require(sessions[0].narrative_feedback.value_or("") == "Boa evolução.",
                    "narrative round-trips");
      suite.require(!sessions[1].z_wpm.has_value(), "absent z_wpm stays absent");
      suite.require(!sessions[1].rci_coverage.has_value(), "absent rci stays absent");
      suite.require(!sessions[1].narrative_feedback.has_value(), "absent narrative stays absent");
      suite.require(sessions[1].keypoint_results.size() == 2, "keypoint results are kept");
      suite.require(sessions[1].keypoint_results[0].matched_tokens ==
                        std::vector<std::string>{"sono", "memorias"},
                    "matched tokens are kept");
      suite.require(sessions[1].recall_text == "Lembrei do sono e da memória.",
                    "utf-8 recall text is kept");
    }
    const auto latest = reopened.latest();
    suite.require(latest.has_value() && latest->coverage_pct == 80.0, "latest from file");

    reopened.clear();
    suite.require(!std::filesystem::exists(path), "clear removes the history file");
    suite.require(reopened.list_all().empty(), "cleared history is empty");
    reopened.clear();
  }

  {
    const auto corrupt = dir / "corrupt.json";
    {
      std::ofstream out(corrupt);
      out << "[{\"session_id\": ";
    }
    recall::JsonFileSessionStore store(corrupt);
    suite.require(store.list_all().empty(), "corrupt file reads as empty history");
    store.save(make_session("3", 65.0));
    suite.require(store.list_all().size() == 1, "saving over a corrupt file starts fresh");
  }

  {
    const auto mixed = dir / "mixed.json";
    {
      nlohmann::json document = nlohmann::json::array();
      document.push_back(recall::bridge::to_json(make_session("5", 70.0)));
      nlohmann::json legacy = nlohmann::json::object();
      legacy["coverage_pct"] = 10.0;
      document.push_back(legacy);
      document.push_back(recall::bridge::to_json(make_session("6", 40.0)));
      std::ofstream out(mixed);
      out << document.dump(2);
    }
    recall::JsonFileSessionStore store(mixed);
    const auto readable = store.list_all();
    suite.require(readable.size() == 2, "undecodable entries are skipped, the rest are kept");
    suite.require(readable.size() == 2 && readable[0].session_id == "5" &&
                      readable[1].session_id == "6",
                  "readable entries keep their order");

    store.save(make_session("7", 90.0));
    const auto after_save = store.list_all();
    suite.require(after_save.size() == 3, "saving keeps every earlier session");
    suite.require(after_save.size() == 3 && after_save[0].session_id == "7",
                  "the new session is first");

    std::ifstream in(mixed);
    const auto on_disk = nlohmann::json::parse(in);
    suite.require(on_disk.is_array() && on_disk.size() == 4,
                  "undecodable entries survive a rewrite");
  }

  {
    const auto bytes = dir / "bytes.json";
    recall::JsonFileSessionStore store(bytes);
    auto session = make_session("8", 100.0);
    session.recall_text = "sono \xff\xfe bom";
    bool saved = true;
    try {
      store.save(session);
    } catch (const std::exception&) {
      saved = false;
    }
    suite.require(saved, "recall text with invalid UTF-8 can be saved");
    const auto sessions = store.list_all();
    suite.require(sessions.size() == 1, "the session with invalid UTF-8 is stored");
    if (sessions.size() == 1) {
      const auto& text = sessions[0].recall_text;
      suite.require(text.rfind("sono ", 0) == 0 && text.size() >= 4 &&
                        text.compare(text.size() - 4, 4, " bom") == 0,
                    "valid parts of the recall text are kept");
      suite.require(text.find("\xEF\xBF\xBD") != std::string::npos,
                    "invalid bytes are stored as U+FFFD");
    }
  }

  bool threw = false;
  try {
    recall::JsonFileSessionStore store{std::filesystem::path()};
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  suite.require(threw, "empty path is rejected");

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}

void test_history_csv(TestSuite& suite) {
  suite.require(recall::history_csv({}) == "Date,Coverage,Z-Score,WPM,Test\n",
                "empty history is just the header");

  auto older = make_session("1", 50.0);
  older.z_coverage = -1.0;
  auto newer = make_session("2", 80.0);
  newer.z_coverage = 1.0;
  newer.wpm_effective = 212;
  newer.test_id = "Sono, memória";
  const auto csv = recall::history_csv({newer, older});
  suite.require(csv == "Date,Coverage,Z-Score,WPM,Test\n"
                       "2024-01-02T09:00:00.000Z,80.0,1.0,212,\"Sono, memória\"\n"
                       "2024-01-01T09:00:00.000Z,50.0,-1.0,150,test-1\n",
                "csv rows follow the history order");

  auto quoted = make_session("3", 12.5);
  quoted.z_coverage = -3.5;
  quoted.test_id = "say \"hi\"";
  suite.require(recall::history_csv({quoted}) ==
                    "Date,Coverage,Z-Score,WPM,Test\n"
                    "2024-01-03T09:00:00.000Z,12.5,-3.5,150,\"say \"\"hi\"\"\"\n",
                "embedded quotes are doubled");
}

void test_json_bridge(TestSuite& suite) {
  using namespace recall::bridge;

  {
    const auto json = nlohmann::json::parse(R"({
      "id": "t-1",
      "language": "pt-BR",
      "passage": "Texto.",
      "keypoints": [
        {"id": 0, "text": "O sono consolida memórias"},
        {"id": 1, "text": "Atenção", "tokens": ["atencao"]}
      ],
      "normative_profile_id": "adult_pt_br_general"
    })");
    const auto test = test_instance_from_json(json);
    suite.require(test.id == "t-1" && test.passage == "Texto.", "test fields are read");
    suite.require(test.complexity == recall::Complexity::Neutral, "complexity defaults to neutral");
    suite.require(test.keypoints.size() == 2, "keypoints are read");
    suite.require(test.keypoints[0].tokens.empty(), "tokens are optional");
    suite.require(test.keypoints[1].tokens == std::vector<std::string>{"atencao"},
                  "stored tokens are read");
    suite.require(test.target_words == 0 && test.created_at.empty(), "optional fields default");

    const auto round_trip = test_instance_from_json(to_json(test));
    suite.require(round_trip.keypoints.size() == 2 &&
                      round_trip.normative_profile_id == "adult_pt_br_general",
                  "serialized test reads back");
  }

  {
    auto session = make_session("4", 33.0);
    session.z_wpm.reset();
    const auto json = to_json(session);
    suite.require(json.contains("z_wpm") && json["z_wpm"].is_null(), "absent z_wpm is null");
    suite.require(json["rci_coverage"].is_null(), "absent rci is null");
    suite.require(json["narrative_feedback"].is_null(), "absent narrative is null");
    suite.require(json["wpm_effective"].get<int>() == 150, "wpm is an integer");
    suite.require(json["keypoint_results"].size() == 2, "keypoint results are written");
  }

  {
    bool threw = false;
    try {
      test_instance_from_json(nlohmann::json::parse(
          R"({"id": "x", "language": "fr-FR", "passage": "", "keypoints": []})"));
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "unknown language is rejected");
  }

  {
    bool threw = false;
    try {
      test_instance_from_json(nlohmann::json::parse(R"({"id": "x", "language": "pt-BR"})"));
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    suite.require(threw, "missing passage is rejected");
  }

  {
    const auto config = test_config_from_json(nlohmann::json::parse(
        R"({"normative_profile_id": "adult_pt_br_general", "complexity": "dense",
            "target_read_time_sec": 90, "use_calibrated_wpm": true, "user_calibrated_wpm": 210})"));
    suite.require(!config.language.has_value(), "language is optional in a config");
    suite.require(config.complexity == recall::Complexity::Dense, "complexity is parsed");
    suite.require(config.target_read_time_sec == 90, "reading time is parsed");
    suite.require(config.use_calibrated_wpm && config.user_calibrated_wpm.value_or(0) == 210.0,
                  "calibration is parsed");
  }

  {
    const auto content = generated_content_from_json(
        nlohmann::json::parse(R"({"passage": "P.", "keypoints": ["a", "b"]})"));
    suite.require(content.passage == "P." && content.keypoint_texts.size() == 2,
                  "generated content is parsed");
  }
}

} // namespace

int main() {
  TestSuite suite;

  test_in_memory_store(suite);
  test_json_file_store(suite);
  test_history_csv(suite);
  test_json_bridge(suite);

  if (!suite.ok) {
    return 1;
  }
  std::cout << "All session store tests passed" << std::endl;
  return 0;
}
