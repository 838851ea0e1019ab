#include "runtime.h"

#include <thread>

#include <pybind11/embed.h>
#include <pybind11/numpy.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <dsbox/paths.h>
#include <dsbox/result_codec.h>
#include "python.h"
#include "transport.h"
#include "utils.h"

namespace py = pybind11;
using namespace pybind11::literals;

namespace {

const char kResultName[] = "result";
const char kUnprintable[] = "<unprintable result>";

// Lone surrogates are legal in a python str but not in UTF-8; they become '?'.
std::string ToUtf8(py::handle str) {
  return str.attr("encode")("utf-8", "replace").cast<std::string>();
}

void ConfigureMatplotlib(py::module_& plt) {
  py::object rc = plt.attr("rcParams");
  // CJK-capable fonts first
  rc["font.sans-serif"] = py::make_tuple(
      "WenQuanYi Micro Hei", "WenQuanYi Zen Hei", "AR PL UKai CN", "AR PL UMing CN",
      "DejaVu Sans", "sans-serif");
  rc["font.serif"] = py::make_tuple("AR PL UMing CN", "AR PL UKai CN", "DejaVu Serif", "serif");
  rc["font.family"] = "sans-serif";
  rc["axes.unicode_minus"] = false;
  rc["figure.figsize"] = py::make_tuple(10, 6);
  rc["figure.dpi"] = 100;
  rc["axes.titlesize"] = 14;
  rc["axes.labelsize"] = 12;
  rc["xtick.labelsize"] = 10;
  rc["ytick.labelsize"] = 10;
  rc["grid.linestyle"] = "--";
  rc["grid.alpha"] = 0.7;
  rc["legend.loc"] = "best";
  rc["legend.fontsize"] = 10;
  rc["axes.axisbelow"] = true;
  rc["figure.autolayout"] = true;
}

// swap sys.stdout / sys.stderr for the lifetime of this object
class StreamCapture {
  py::object out_, err_, old_out_, old_err_;
 public:
  StreamCapture() {
    py::module_ io = py::module_::import("io");
    out_ = io.attr("StringIO")();
    err_ = io.attr("StringIO")();
    py::module_ sys = py::module_::import("sys");
    old_out_ = sys.attr("stdout");
    old_err_ = sys.attr("stderr");
    PySys_SetObject("stdout", out_.ptr());
    PySys_SetObject("stderr", err_.ptr());
  }
  ~StreamCapture() {
    PySys_SetObject("stdout", old_out_.ptr());
    PySys_SetObject("stderr", old_err_.ptr());
  }
  std::string Out() const { return Drain(out_, "stdout"); }
  std::string Err() const { return Drain(err_, "stderr"); }

 private:
  // empty if the script closed the stream
  static std::string Drain(const py::object& buf, const char* name) {
    try {
      return ToUtf8(buf.attr("getvalue")());
    } catch (const std::exception& err) {
      spdlog::info("Captured {} is unreadable: {}", name, err.what());
      return "";
    }
  }
};

std::string FormatException(py::error_already_set& err) {
  std::string type = "Exception";
  std::string msg;
  try {
    type = ToUtf8(err.type().attr("__name__"));
    msg = ToUtf8(py::str(err.value()));
  } catch (const std::exception&) {
    msg = kUnprintable;
  }
  std::string trace;
  try {
    py::object lines = py::module_::import("traceback").attr("format_exception")(
        err.type(), err.value(), err.trace());
    trace = ToUtf8(py::str("").attr("join")(lines));
  } catch (const std::exception&) {
    trace = "(traceback unavailable)\n";
  }
  return type + ": " + msg + "\n" + trace;
}

std::string RenderFigure(py::module_& plt, py::object fig) {
  py::object font_properties = py::module_::import("matplotlib.font_manager").attr("FontProperties");
  auto normalize = [&](py::handle text) {
    if (text.is_none()) return;
    text.attr("set_fontproperties")(
        font_properties("family"_a = "sans-serif", "size"_a = text.attr("get_fontsize")()));
  };
  for (py::handle ax : fig.attr("get_axes")()) {
    for (py::handle text : ax.attr("texts")) normalize(text);
    normalize(ax.attr("title"));
    normalize(ax.attr("xaxis").attr("label"));
    normalize(ax.attr("yaxis").attr("label"));
    for (py::handle label : ax.attr("get_xticklabels")()) normalize(label);
    for (py::handle label : ax.attr("get_yticklabels")()) normalize(label);
    ax.attr("set_axisbelow")(true);
  }
  plt.attr("tight_layout")();
  py::object buf = py::module_::import("io").attr("BytesIO")();
  plt.attr("savefig")(buf, "format"_a = "png", "dpi"_a = 300, "bbox_inches"_a = "tight");
  return buf.attr("getvalue")().cast<std::string>();
}

std::string ToText(py::handle value) {
  try {
    return ToUtf8(py::str(value));
  } catch (const std::exception& err) {
    spdlog::debug("str() of result failed: {}", err.what());
    return kUnprintable;
  }
}

std::optional<NumericArray> ToNumericArray(py::module_& np, py::handle value) {
  if (!py::hasattr(value, "__array__")) return std::nullopt;
  py::object arr = np.attr("asarray")(value);
  // scalars (numpy or not) are reported as text
  if (arr.attr("ndim").cast<long>() == 0) return std::nullopt;
  std::string kind = py::str(arr.attr("dtype").attr("kind"));
  if (kind != "b" && kind != "i" && kind != "u" && kind != "f") return std::nullopt;
  auto data = py::array_t<double, py::array::c_style | py::array::forcecast>::ensure(arr);
  if (!data) return std::nullopt;
  NumericArray ret;
  for (py::ssize_t i = 0; i < data.ndim(); i++) ret.shape.push_back(data.shape(i));
  ret.values.assign(data.data(), data.data() + data.size());
  return ret;
}

ResultValue Classify(py::module_& pd, py::module_& np, py::handle value) {
  try {
    if (py::isinstance(value, pd.attr("DataFrame"))) {
      std::string split = py::str(value.attr("to_json")(
          "orient"_a = "split", "date_format"_a = "iso", "default_handler"_a = py::module_::import("builtins").attr("str")));
      return TableFromJson(nlohmann::json::parse(split));
    }
    if (py::isinstance(value, pd.attr("Series"))) {
      py::object name = value.attr("name");
      std::string split = py::str(value.attr("to_json")(
          "orient"_a = "split", "date_format"_a = "iso", "default_handler"_a = py::module_::import("builtins").attr("str")));
      return SeriesFromJson(nlohmann::json::parse(split), name.is_none() ? kDefaultSeriesName : ToText(name));
    }
    if (auto arr = ToNumericArray(np, value)) return std::move(*arr);
  } catch (const std::exception& err) {
    // python errors, malformed to_json output and cast failures alike
    spdlog::info("Result falls back to text: {}", err.what());
  }
  return OtherValue{ToText(value)};
}

} // namespace

struct Runtime::Context {
  py::module_ pd, np, plt, mpl;
  py::dict globals;
};

Runtime::Runtime(const fs::path& dataset) {
  EnsureInterpreter();
  py::gil_scoped_acquire gil;
  auto ctx = std::make_unique<Context>();
  try {
    ctx->mpl = py::module_::import("matplotlib");
    ctx->mpl.attr("use")("Agg");
    ctx->plt = py::module_::import("matplotlib.pyplot");
    ctx->np = py::module_::import("numpy");
    ctx->pd = py::module_::import("pandas");
    ConfigureMatplotlib(ctx->plt);
  } catch (py::error_already_set& err) {
    throw RuntimeSetupError(std::string("cannot load analysis libraries: ") + err.what());
  }
  ctx->globals["__builtins__"] = py::module_::import("builtins");
  ctx->globals["pd"] = ctx->pd;
  ctx->globals["np"] = ctx->np;
  ctx->globals["plt"] = ctx->plt;
  ctx->globals["mpl"] = ctx->mpl;
  try {
    ctx->globals["df"] = ctx->pd.attr("read_csv")(dataset.string());
  } catch (py::error_already_set& err) {
    throw RuntimeSetupError("cannot load dataset " + dataset.string() + ": " + err.what());
  }
  spdlog::info("Runtime ready with dataset {}", dataset.c_str());
  ctx_ = std::move(ctx);
}

Runtime::~Runtime() {
  if (!ctx_) return;
  // python objects must be released under the GIL
  py::gil_scoped_acquire gil;
  ctx_.reset();
}

ExecuteResult Runtime::Execute(const std::string& code) {
  py::gil_scoped_acquire gil;
  ExecuteResult ret;
  if (ctx_->globals.contains(kResultName)) PyDict_DelItemString(ctx_->globals.ptr(), kResultName);
  std::string captured_err;
  {
    StreamCapture capture;
    try {
      py::module_ builtins = py::module_::import("builtins");
      py::object compiled = builtins.attr("compile")(py::str(code), "<script>", "exec");
      builtins.attr("exec")(compiled, ctx_->globals);
      py::object fig = ctx_->plt.attr("gcf")();
      if (py::len(fig.attr("get_axes")())) ret.figure = RenderFigure(ctx_->plt, fig);
      if (ctx_->globals.contains(kResultName)) {
        py::object value = ctx_->globals[kResultName];
        ret.result = Classify(ctx_->pd, ctx_->np, value);
      }
      ret.success = true;
    } catch (py::error_already_set& err) {
      ret.success = false;
      ret.result.reset();
      ret.figure.reset();
      ret.error = FormatException(err);
    } catch (const std::exception& err) {
      // conversions of what the script left behind
      spdlog::warn("Failed collecting results: {}", err.what());
      ret.success = false;
      ret.result.reset();
      ret.figure.reset();
      ret.error = std::string("failed to collect results: ") + err.what() + "\n";
    }
    try {
      ctx_->plt.attr("close")("all");
    } catch (py::error_already_set& err) {
      spdlog::warn("Failed closing figures: {}", err.what());
    }
    ret.output = capture.Out();
    captured_err = capture.Err();
  }
  ret.error += captured_err;
  return ret;
}

namespace {

// the loop outlives any single request, whatever it does
std::string Respond(Runtime& runtime, const std::string& code) {
  try {
    ExecuteResult res = runtime.Execute(code);
    spdlog::info("Request finished: success={}", res.success);
    return DumpResult(res);
  } catch (const std::exception& err) {
    spdlog::error("Request aborted: {}", err.what());
    return DumpResult(ExecuteResult::Failure(std::string("runtime error: ") + err.what()));
  }
}

} // namespace

void ServeWorkspace(const fs::path& workspace, std::chrono::milliseconds interval) {
  Runtime runtime(DatasetFile(workspace));
  Channel channel(workspace);
  spdlog::info("Serving {}", workspace.c_str());
  while (!channel.StopRequested()) {
    auto code = channel.TakeRequest();
    if (!code) {
      std::this_thread::sleep_for(interval);
      continue;
    }
    spdlog::info("Executing request of {} bytes", code->size());
    if (!channel.PutResponse(Respond(runtime, *code))) {
      spdlog::error("Failed writing response to {}", workspace.c_str());
    }
  }
  spdlog::info("Stop requested; leaving {}", workspace.c_str());
}

void ServeShared(const fs::path& data_dir, std::chrono::milliseconds interval) {
  spdlog::info("Serving shared requests under {}", data_dir.c_str());
  Channel root(data_dir);
  while (!root.StopRequested()) {
    std::error_code ec;
    // the directory may vanish under us; never let the iterator throw
    for (fs::directory_iterator it(data_dir, ec), end; !ec && it != end; it.increment(ec)) {
      const fs::directory_entry& entry = *it;
      std::error_code type_ec;
      if (!entry.is_directory(type_ec)) continue;
      Channel channel(entry.path());
      auto code = channel.TakeRequest();
      if (!code) continue;
      spdlog::info("Executing shared request {}", entry.path().filename().c_str());
      std::string response;
      try {
        Runtime runtime(DatasetFile(entry.path()));
        response = Respond(runtime, *code);
      } catch (const RuntimeSetupError& err) {
        response = DumpResult(ExecuteResult::Failure(err.what()));
      }
      if (!channel.PutResponse(response)) {
        spdlog::error("Failed writing response to {}", entry.path().c_str());
      }
    }
    if (ec) spdlog::warn("Failed listing {}: {}", data_dir.c_str(), ec.message());
    std::this_thread::sleep_for(interval);
  }
  spdlog::info("Stop requested; leaving {}", data_dir.c_str());
}
