#include "python.h"

#include <mutex>

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

namespace py = pybind11;

namespace {

// thread state of the initializing thread, parked for the process lifetime
PyThreadState* main_thread_state = nullptr;

} // namespace

void EnsureInterpreter() {
  static std::once_flag flag;
  std::call_once(flag, []() {
    if (!Py_IsInitialized()) {
      spdlog::debug("Initializing embedded Python interpreter");
      py::initialize_interpreter(false);
    }
    // the interpreter lives until process exit; the GIL is taken per use
    if (PyGILState_Check()) main_thread_state = PyEval_SaveThread();
  });
}

std::optional<std::string> CheckSyntax(const std::string& code) {
  EnsureInterpreter();
  py::gil_scoped_acquire gil;
  try {
    py::module_::import("ast").attr("parse")(py::bytes(code), "<script>", "exec");
    return std::nullopt;
  } catch (py::error_already_set& err) {
    if (err.matches(PyExc_SyntaxError)) {
      py::object value = err.value();
      long line = 0, col = 0;
      if (!value.attr("lineno").is_none()) line = value.attr("lineno").cast<long>();
      if (!value.attr("offset").is_none()) col = value.attr("offset").cast<long>();
      std::string msg = py::str(value.attr("msg"));
      return "syntax error at line " + std::to_string(line) + " col " + std::to_string(col) + ": " + msg;
    }
    // ValueError (null bytes) and decoding errors
    return std::string("syntax error at line 0 col 0: ") + err.what();
  }
}
