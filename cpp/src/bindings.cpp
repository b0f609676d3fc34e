#include <nlohmann/json.hpp>
#include "../include/recall/evaluation.hpp"
#include "../include/recall/errors.hpp"
#include "../include/recall/item_store.hpp"
#include "../include/recall/practice_engine.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

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
  if (py::isinstance<py::list>(handle) || py::isinstance<py::tuple>(handle) ||
      py::isinstance<py::set>(handle)) {
    nlohmann::json json_array = nlohmann::json::array();
    for (auto item : handle) {
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
    for (auto it = json_value.begin(); it != json_value.end(); ++it) {
      dict[py::str(it.key())] = json_to_py(it.value());
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

class PyPracticeEngine {
public:
  PyPracticeEngine(py::object config_obj, py::object content_obj) {
    if (!content_obj.is_none()) {
      for (auto& item : recall::bridge::load_content_items(py_to_json(content_obj))) {
        store_.add_item(std::move(item));
      }
    }
    engine_ = recall::make_engine(store_, recall::bridge::engine_config_from_json(py_to_json(config_obj)));
  }

  py::object create_session(py::object configuration_obj, std::int64_t now) {
    auto configuration = recall::bridge::session_configuration_from_json(py_to_json(configuration_obj));
    return json_to_py(recall::bridge::to_json(engine_->create_session(configuration, now)));
  }

  py::object start(const std::string& session_id, std::int64_t now) {
    return json_to_py(recall::bridge::to_json(engine_->start(session_id, now)));
  }

  py::object submit_answer(const std::string& session_id, py::object submission_obj,
                           std::int64_t now) {
    auto submission = recall::bridge::submission_from_json(py_to_json(submission_obj));
    return json_to_py(recall::bridge::to_json(engine_->submit_answer(session_id, submission, now)));
  }

  py::object skip(const std::string& session_id, std::int64_t now) {
    return json_to_py(recall::bridge::to_json(engine_->skip(session_id, now)));
  }

  py::object advance(const std::string& session_id, std::int64_t now) {
    return json_to_py(recall::bridge::to_json(engine_->advance(session_id, now)));
  }

  py::object toggle_hint(const std::string& session_id) {
    return json_to_py(recall::bridge::to_json(engine_->toggle_hint(session_id)));
  }

  py::object cancel(const std::string& session_id, std::int64_t now) {
    return json_to_py(recall::bridge::to_json(engine_->cancel(session_id, now)));
  }

  py::object finish(const std::string& session_id, std::int64_t now) {
    return json_to_py(recall::bridge::to_json(engine_->finish(session_id, now)));
  }

  py::object snapshot(const std::string& session_id) const {
    return json_to_py(recall::bridge::to_json(engine_->snapshot(session_id)));
  }

  std::size_t pending_writes(const std::string& session_id) const {
    return engine_->pending_writes(session_id);
  }

  void flush(const std::string& session_id) { engine_->flush(session_id); }

  py::object reload_session(const std::string& session_id) {
    return json_to_py(recall::bridge::to_json(engine_->reload_session(session_id)));
  }

  void close_session(const std::string& session_id) { engine_->close_session(session_id); }

  std::vector<std::string> session_ids() const { return engine_->session_ids(); }

  py::object schedule_stats(const std::string& topic_id, const std::vector<std::string>& paths,
                            std::int64_t now) {
    return json_to_py(recall::bridge::to_json(engine_->schedule_stats(topic_id, paths, now)));
  }

  py::object review_forecast(const std::string& topic_id, const std::vector<std::string>& paths,
                             std::int64_t now, int days) {
    return json_to_py(recall::bridge::to_json(engine_->review_forecast(topic_id, paths, now, days)));
  }

  py::object reschedule_item(const std::string& item_id, std::int64_t new_due_at,
                             std::int64_t now) {
    return json_to_py(recall::bridge::to_json(engine_->reschedule_item(item_id, new_due_at, now)));
  }

  py::object record(const std::string& item_id) const {
    auto found = store_.record(item_id);
    return found.has_value() ? json_to_py(recall::bridge::to_json(*found)) : py::none();
  }

private:
  recall::InMemoryItemStore store_;
  std::unique_ptr<recall::PracticeEngine> engine_;
};

} // namespace

PYBIND11_MODULE(_recallcore, m) {
  auto& base = py::register_exception<recall::Error>(m, "RecallError", PyExc_RuntimeError);
  py::register_exception<recall::InvalidTransition>(m, "InvalidTransition", base.ptr());
  py::register_exception<recall::InvalidSubmissionShape>(m, "InvalidSubmissionShape", base.ptr());
  auto& storage = py::register_exception<recall::StorageError>(m, "StorageError", base.ptr());
  py::register_exception<recall::ConflictError>(m, "ConflictError", storage.ptr());

  py::class_<PyPracticeEngine>(m, "PracticeEngine")
      .def(py::init<py::object, py::object>(), py::arg("config") = py::none(),
           py::arg("content") = py::none())
      .def("create_session", &PyPracticeEngine::create_session, py::arg("configuration"),
           py::arg("now"))
      .def("start", &PyPracticeEngine::start)
      .def("submit_answer", &PyPracticeEngine::submit_answer)
      .def("skip", &PyPracticeEngine::skip)
      .def("advance", &PyPracticeEngine::advance)
      .def("toggle_hint", &PyPracticeEngine::toggle_hint)
      .def("cancel", &PyPracticeEngine::cancel)
      .def("finish", &PyPracticeEngine::finish)
      .def("snapshot", &PyPracticeEngine::snapshot)
      .def("pending_writes", &PyPracticeEngine::pending_writes)
      .def("flush", &PyPracticeEngine::flush)
      .def("reload_session", &PyPracticeEngine::reload_session)
      .def("close_session", &PyPracticeEngine::close_session)
      .def("session_ids", &PyPracticeEngine::session_ids)
      .def("schedule_stats", &PyPracticeEngine::schedule_stats)
      .def("review_forecast", &PyPracticeEngine::review_forecast)
      .def("reschedule_item", &PyPracticeEngine::reschedule_item)
      .def("record", &PyPracticeEngine::record);

  m.def("evaluate", [](py::object item_obj, py::object submission_obj, std::uint64_t elapsed_ms) {
    auto item = recall::bridge::content_item_from_json(py_to_json(item_obj));
    auto submission = recall::bridge::submission_from_json(py_to_json(submission_obj));
    return json_to_py(recall::bridge::to_json(recall::evaluate(item, submission, elapsed_ms)));
  }, py::arg("item"), py::arg("submission"), py::arg("elapsed_ms") = 0);

  m.def("update_record", [](py::object record_obj, int quality, std::int64_t now) {
    auto record = recall::bridge::scheduling_record_from_json(py_to_json(record_obj));
    return json_to_py(recall::bridge::to_json(recall::scheduler::update(record, quality, now)));
  }, py::arg("record"), py::arg("quality"), py::arg("now"));
}
