#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include "spymon/spymon.hpp"

namespace py = pybind11;

class PyProfiler {
public:
    PyProfiler(int pid, spymon::Config config)
        : session_(std::make_unique<spymon::Session>(pid, std::move(config))) {}

    std::string finish() {
        return session_->stop();
    }

    // Stop without raising; the profile stays available through result().
    void exit() {
        if (!session_->active()) return;
        try {
            result_ = session_->stop();
        } catch (const spymon::Error& e) {
            error_ = e.what();
        }
    }

    bool active() const { return session_->active(); }
    std::optional<std::string> result() const { return result_; }
    std::optional<std::string> error() const { return error_; }

private:
    std::unique_ptr<spymon::Session> session_;
    std::optional<std::string> result_;
    std::optional<std::string> error_;
};

static spymon::Config makeConfig(int rate, const std::string& format, bool idle, bool gil,
                                 bool threads, bool subprocesses, bool lineNumbers,
                                 const std::string& logPath, bool debug) {
    spymon::Config c;
    c.sampleRate = rate;
    c.format = spymon::parseFileFormat(format);
    c.includeIdle = idle;
    c.gilOnly = gil;
    c.includeThreadIds = threads;
    c.subprocesses = subprocesses;
    c.showLineNumbers = lineNumbers;
    c.logPath = logPath;
    c.enableDebugOutput = debug;
    return c;
}

PYBIND11_MODULE(_spymon, m) {
    m.doc() = "spymon sampling profiler controller";

    py::class_<PyProfiler>(m, "Profiler")
        .def(py::init([](int pid, int rate, const std::string& format, bool idle, bool gil,
                         bool threads, bool subprocesses, bool lineNumbers,
                         const std::string& logPath, bool debug) {
                 auto config = makeConfig(rate, format, idle, gil, threads, subprocesses,
                                          lineNumbers, logPath, debug);
                 // Attaching and the readiness wait may take a while; let
                 // other Python threads (often the target itself) run.
                 py::gil_scoped_release release;
                 return std::make_unique<PyProfiler>(pid, std::move(config));
             }),
             py::arg("pid"),
             py::arg("rate") = 100,
             py::arg("format") = "speedscope",
             py::arg("idle") = false,
             py::arg("gil") = false,
             py::arg("threads") = false,
             py::arg("subprocesses") = false,
             py::arg("line_numbers") = true,
             py::arg("log_path") = "",
             py::arg("debug") = false)
        .def("finish", &PyProfiler::finish, py::call_guard<py::gil_scoped_release>())
        .def_property_readonly("active", &PyProfiler::active)
        .def_property_readonly("result", &PyProfiler::result)
        .def_property_readonly("error", &PyProfiler::error)
        .def("__enter__", [](PyProfiler& self) -> PyProfiler& { return self; },
             py::return_value_policy::reference)
        .def("__exit__", [](PyProfiler& self, py::object, py::object, py::object) {
            py::gil_scoped_release release;
            self.exit();
        });

    py::register_exception<spymon::Error>(m, "ProfilerError", PyExc_RuntimeError);
}
