#include "sz/analytics.hpp"
#include "sz/catalog_content_service.hpp"
#include "sz/config.hpp"
#include "sz/durable_stores.hpp"
#include "sz/errors.hpp"
#include "sz/session_orchestrator.hpp"

#include "json_bridge.hpp"

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>

#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>

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
    for (const auto& [key, value] : json_value.items()) {
      dict[py::str(key)] = json_to_py(value);
    }
    return dict;
  }
  throw std::runtime_error("Unhandled JSON type");
}

nlohmann::json ok_envelope(nlohmann::json data) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "ok";
  payload["data"] = std::move(data);
  return payload;
}

nlohmann::json error_envelope(const std::string& code, bool retriable,
                              const std::string& message) {
  nlohmann::json payload = nlohmann::json::object();
  payload["status"] = "error";
  payload["code"] = code;
  payload["retriable"] = retriable;
  payload["message"] = message;
  return payload;
}

template <typename Fn>
py::object guarded(Fn&& fn) {
  try {
    return json_to_py(ok_envelope(fn()));
  } catch (const sz::EngineError& ex) {
    return json_to_py(error_envelope(ex.code(), ex.retriable(), ex.what()));
  } catch (const nlohmann::json::exception& ex) {
    return json_to_py(error_envelope("invalid_argument", false, ex.what()));
  } catch (const std::invalid_argument& ex) {
    return json_to_py(error_envelope("invalid_argument", false, ex.what()));
  } catch (const std::exception& ex) {
    return json_to_py(error_envelope("internal", false, ex.what()));
  }
}

class PySessionOrchestrator {
public:
  PySessionOrchestrator(const std::string& catalog_path, const std::string& store_dir,
                        py::object config_obj, const std::string& analytics_path) {
    sz::EngineConfig config;
    if (!config_obj.is_none()) {
      config = sz::engine_config_from_json(py_to_json(config_obj));
    }

    sz::Dependencies deps;
    deps.content = std::make_shared<sz::CatalogContentService>(sz::load_catalog(catalog_path));
    if (store_dir.empty()) {
      deps.durable = std::make_shared<sz::InMemoryDurableStore>();
    } else {
      deps.durable = std::make_shared<sz::FileDurableStore>(store_dir);
    }
    if (!analytics_path.empty()) {
      analytics_file_ = std::make_unique<std::ofstream>(analytics_path, std::ios::app);
      if (!analytics_file_->is_open()) {
        throw std::runtime_error("Failed to open analytics log: " + analytics_path);
      }
      deps.analytics = std::make_shared<sz::StreamAnalyticsSink>(*analytics_file_);
    }
    orchestrator_ = sz::make_orchestrator(std::move(deps), config);
  }

  py::object start_session(const std::string& user_id, const std::vector<std::string>& domains,
                           bool extra_curricular, py::object max_items) {
    return guarded([&] {
      sz::StartOptions options;
      options.extra_curricular = extra_curricular;
      if (!max_items.is_none()) {
        options.max_items = max_items.cast<std::size_t>();
      }
      return sz::bridge::to_json(orchestrator_->start_session(user_id, domains, options));
    });
  }

  py::object interact(const std::string& session_id, py::object event_obj) {
    return guarded([&] {
      auto event = sz::bridge::interaction_event_from_json(py_to_json(event_obj));
      return sz::bridge::to_json(orchestrator_->interact(session_id, event));
    });
  }

  py::object pause_session(const std::string& session_id) {
    return guarded([&] {
      orchestrator_->pause_session(session_id);
      return nlohmann::json(nullptr);
    });
  }

  py::object resume_session(const std::string& session_id) {
    return guarded(
        [&] { return sz::bridge::to_json(orchestrator_->resume_session(session_id)); });
  }

  py::object end_session(const std::string& session_id) {
    return guarded([&] { return sz::bridge::to_json(orchestrator_->end_session(session_id)); });
  }

  py::object snapshot(const std::string& session_id) {
    return guarded([&] { return sz::bridge::to_json(orchestrator_->snapshot(session_id)); });
  }

  py::object rebuild_effectiveness(const std::string& session_id) {
    return guarded(
        [&] { return sz::bridge::to_json(orchestrator_->rebuild_effectiveness(session_id)); });
  }

  bool degraded(const std::string& session_id) { return orchestrator_->degraded(session_id); }

private:
  // Declared first so the sink writing into it is torn down before it.
  std::unique_ptr<std::ofstream> analytics_file_;
  std::unique_ptr<sz::SessionOrchestrator> orchestrator_;
};

} // namespace

PYBIND11_MODULE(_sayzhong, m) {
  m.attr("SCHEMA_VERSION") = sz::bridge::kSchemaVersion;

  py::class_<PySessionOrchestrator>(m, "SessionOrchestrator")
      .def(py::init<const std::string&, const std::string&, py::object, const std::string&>(),
           py::arg("catalog_path"), py::arg("store_dir") = std::string(),
           py::arg("config") = py::none(), py::arg("analytics_path") = std::string())
      .def("start_session", &PySessionOrchestrator::start_session, py::arg("user_id"),
           py::arg("domains"), py::arg("extra_curricular") = false,
           py::arg("max_items") = py::none())
      .def("interact", &PySessionOrchestrator::interact, py::arg("session_id"), py::arg("event"))
      .def("pause_session", &PySessionOrchestrator::pause_session)
      .def("resume_session", &PySessionOrchestrator::resume_session)
      .def("end_session", &PySessionOrchestrator::end_session)
      .def("snapshot", &PySessionOrchestrator::snapshot)
      .def("rebuild_effectiveness", &PySessionOrchestrator::rebuild_effectiveness)
      .def("degraded", &PySessionOrchestrator::degraded);
}
