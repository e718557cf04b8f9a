#include "recall/scoring_engine.hpp"
#include "recall/test_builder.hpp"
#include "recall/tokenizer.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

namespace py = pybind11;

namespace {

// Plain Python data (dict, list, tuple, str, int, float, bool, None) to JSON.
nlohmann::json py_to_json(py::handle value) {
  if (value.is_none()) {
    return nullptr;
  }
  // bool is a subclass of int, so it is checked first.
  if (py::isinstance<py::bool_>(value)) {
    return value.cast<bool>();
  }
  if (py::isinstance<py::int_>(value)) {
    return value.cast<std::int64_t>();
  }
  if (py::isinstance<py::float_>(value)) {
    return value.cast<double>();
  }
  if (py::isinstance<py::str>(value)) {
    return value.cast<std::string>();
  }
  if (py::isinstance<py::dict>(value)) {
    auto object = nlohmann::json::object();
    for (const auto& [key, item] : value.cast<py::dict>()) {
      if (!py::isinstance<py::str>(key)) {
        throw py::type_error("dict keys must be str");
      }
      object[key.cast<std::string>()] = py_to_json(item);
    }
    return object;
  }
  if (py::isinstance<py::list>(value) || py::isinstance<py::tuple>(value)) {
    auto array = nlohmann::json::array();
    for (const auto item : value.cast<py::sequence>()) {
      array.push_back(py_to_json(item));
    }
    return array;
  }
  throw py::type_error("cannot convert " + py::repr(value).cast<std::string>() + " to JSON");
}

py::object json_to_py(const nlohmann::json& value) {
  using Type = nlohmann::json::value_t;
  switch (value.type()) {
    case Type::null:
    case Type::discarded:
      return py::none();
    case Type::boolean:
      return py::bool_(value.get<bool>());
    case Type::number_integer:
      return py::int_(value.get<std::int64_t>());
    case Type::number_unsigned:
      return py::int_(value.get<std::uint64_t>());
    case Type::number_float:
      return py::float_(value.get<double>());
    case Type::string:
      return py::str(value.get_ref<const std::string&>());
    case Type::array: {
      py::list list;
      for (const auto& element : value) {
        list.append(json_to_py(element));
      }
      return std::move(list);
    }
    case Type::object: {
      py::dict dict;
      for (const auto& entry : value.items()) {
        dict[py::str(entry.key())] = json_to_py(entry.value());
      }
      return std::move(dict);
    }
    default:
      break;
  }
  throw std::runtime_error("JSON value has no Python equivalent");
}

class PyScoringEngine {
public:
  PyScoringEngine() : engine_(std::make_unique<recall::ScoringEngine>()) {}

  explicit PyScoringEngine(const std::string& catalog_path)
      : engine_(std::make_unique<recall::ScoringEngine>(
            recall::resources::load_profile_catalog(catalog_path))) {}

  py::object score_session(py::object test_obj, const std::string& recall_text,
                           double elapsed_time_sec, py::object previous_obj) {
    const auto test = recall::bridge::test_instance_from_json(py_to_json(test_obj));
    std::optional<recall::SessionResult> previous;
    if (!previous_obj.is_none()) {
      previous = recall::bridge::session_result_from_json(py_to_json(previous_obj));
    }
    const auto result = engine_->score_session(test, recall_text, elapsed_time_sec, previous);
    return json_to_py(recall::bridge::to_json(result));
  }

  py::list list_profiles() const {
    py::list profiles;
    for (const auto& profile : engine_->catalog().profiles()) {
      profiles.append(json_to_py(recall::bridge::to_json(profile)));
    }
    return profiles;
  }

  py::object plan_test(py::object config_obj) const {
    const auto config = recall::bridge::test_config_from_json(py_to_json(config_obj));
    return json_to_py(recall::bridge::to_json(recall::plan_test(config, engine_->catalog())));
  }

private:
  std::unique_ptr<recall::ScoringEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_recallcore, m) {
  m.def("tokenize",
        [](const std::string& text, const std::string& language) {
          return recall::tokenize(text, recall::language_from_string(language));
        },
        py::arg("text"), py::arg("language") = std::string("pt-BR"));

  m.def("build_test",
        [](py::object plan_obj, py::object content_obj) {
          const auto plan = recall::bridge::test_plan_from_json(py_to_json(plan_obj));
          const auto content = recall::bridge::generated_content_from_json(py_to_json(content_obj));
          recall::RandomIdGenerator ids;
          recall::SystemClock clock;
          return json_to_py(recall::bridge::to_json(
              recall::build_test_instance(plan, content, ids, clock)));
        },
        py::arg("plan"), py::arg("content"));

  py::class_<PyScoringEngine>(m, "ScoringEngine")
      .def(py::init<>())
      .def(py::init<std::string>(), py::arg("catalog_path"))
      .def("score_session", &PyScoringEngine::score_session, py::arg("test"),
           py::arg("recall_text"), py::arg("elapsed_time_sec"),
           py::arg("previous") = py::none())
      .def("list_profiles", &PyScoringEngine::list_profiles)
      .def("plan_test", &PyScoringEngine::plan_test, py::arg("config"));
}
