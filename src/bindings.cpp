#include "hero/recommendation_engine.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <cstdint>
#include <optional>

namespace py = pybind11;

namespace {

nlohmann::json py_to_json(py::handle handle) {
  if (handle.is_none()) {
    return nullptr;
  }
  if (py::isinstance<py::bool_>(handle)) {
    return handle.cast<bool>();
  }
  if (py::isinstance<py::int_>(handle)) {
    return static_cast<long long>(handle.cast<long long>());
  }
  if (py::isinstance<py::float_>(handle)) {
    return handle.cast<double>();
  }
  if (py::isinstance<py::str>(handle)) {
    return handle.cast<std::string>();
  }
  if (py::isinstance<py::dict>(handle)) {
    nlohmann::json json_obj = nlohmann::json::object();
    for (auto item : handle.cast<py::dict>()) {
      auto key = py::cast<std::string>(item.first);
      json_obj[key] = py_to_json(item.second);
    }
    return json_obj;
  }
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle.cast<py::sequence>()) {
      json_array.push_back(py_to_json(item));
    }
    return json_array;
  }
  throw std::runtime_error("Unsupported Python type for JSON conversion");
}

py::object json_to_py(const nlohmann::json& json_value) {
  if (json_value.is_null()) {
    return py::none();
  }
  if (json_value.is_boolean()) {
    return py::bool_(json_value.get<bool>());
  }
  if (json_value.is_number_unsigned()) {
    return py::int_(json_value.get<unsigned long long>());
  }
  if (json_value.is_number_integer()) {
    return py::int_(json_value.get<long long>());
  }
  if (json_value.is_number_float()) {
    return py::float_(json_value.get<double>());
  }
  if (json_value.is_string()) {
    return py::str(json_value.get<std::string>());
  }
  if (json_value.is_array()) {
    py::list list;
    for (const auto& element : json_value) {
      list.append(json_to_py(element));
    }
    return list;
  }
  if (json_value.is_object()) {
    py::dict dict;
    for (const auto& entry : json_value.items()) {
      dict[py::str(entry.key())] = json_to_py(entry.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

class PyRecommendationEngine {
public:
  explicit PyRecommendationEngine(py::object config_obj)
      : engine_(hero::make_engine(hero::bridge::engine_config_from_json(py_to_json(config_obj)))) {}

  void record_attempt(py::object attempt_obj) {
    const auto attempt =
        hero::bridge::attempt_from_json(py_to_json(attempt_obj), engine_->config().now());
    py::gil_scoped_release release;
    engine_->record_attempt(attempt);
  }

  py::object get_recommendation(const std::string& user_id, std::optional<std::int64_t> now_ms) {
    const auto rec = now_ms ? engine_->get_recommendation(user_id, hero::from_epoch_ms(*now_ms))
                            : engine_->get_recommendation(user_id);
    return json_to_py(hero::bridge::to_json(rec));
  }

  py::object get_cognitive_status(const std::string& user_id) {
    return json_to_py(hero::bridge::to_json(engine_->get_cognitive_status(user_id)));
  }

  py::object get_clinical_assessment(const std::string& user_id) {
    return json_to_py(hero::bridge::to_json(engine_->get_clinical_assessment(user_id)));
  }

  py::list get_clinical_recommendations(const std::string& user_id) {
    py::list result;
    for (const auto& rec : engine_->get_clinical_recommendations(user_id)) {
      result.append(json_to_py(hero::bridge::to_json(rec)));
    }
    return result;
  }

  py::object get_learning_curve(const std::string& user_id) {
    return json_to_py(hero::bridge::to_json(engine_->get_learning_curve(user_id)));
  }

  py::object get_progress_report(const std::string& user_id, std::int64_t since_ms) {
    const auto report = engine_->get_progress_report(user_id, hero::from_epoch_ms(since_ms));
    return json_to_py(hero::bridge::to_json(report));
  }

  py::object export_user(const std::string& user_id) {
    return json_to_py(hero::bridge::to_json(engine_->export_user(user_id)));
  }

  void import_user(const std::string& user_id, py::object state_obj) {
    const auto state =
        hero::bridge::user_state_from_json(py_to_json(state_obj), engine_->config().window_size);
    engine_->import_user(user_id, state);
  }

  py::object debug_state(const std::string& user_id) {
    return json_to_py(engine_->debug_state(user_id));
  }

  py::object config() const {
    return json_to_py(hero::bridge::to_json(engine_->config()));
  }

private:
  std::unique_ptr<hero::RecommendationEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_herocore, m) {
  py::register_exception<hero::StoreUnavailable>(m, "StoreUnavailable", PyExc_RuntimeError);

  py::class_<PyRecommendationEngine>(m, "RecommendationEngine")
      .def(py::init<py::object>(), py::arg("config") = py::none())
      .def("record_attempt", &PyRecommendationEngine::record_attempt, py::arg("attempt"))
      .def("get_recommendation", &PyRecommendationEngine::get_recommendation,
           py::arg("user_id"), py::arg("now_ms") = py::none())
      .def("get_cognitive_status", &PyRecommendationEngine::get_cognitive_status)
      .def("get_clinical_assessment", &PyRecommendationEngine::get_clinical_assessment)
      .def("get_clinical_recommendations", &PyRecommendationEngine::get_clinical_recommendations)
      .def("get_learning_curve", &PyRecommendationEngine::get_learning_curve)
      .def("get_progress_report", &PyRecommendationEngine::get_progress_report,
           py::arg("user_id"), py::arg("since_ms") = 0)
      .def("export_user", &PyRecommendationEngine::export_user)
      .def("import_user", &PyRecommendationEngine::import_user)
      .def("debug_state", &PyRecommendationEngine::debug_state)
      .def("config", &PyRecommendationEngine::config);

  m.def("scenarios", []() {
    py::list names;
    for (auto scenario : hero::kAllScenarios) {
      names.append(hero::to_string(scenario));
    }
    return names;
  });
}
