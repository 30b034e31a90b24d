#include "sandbox/worker_process.hpp"

#if __has_include(<boost/process/v1.hpp>)
#include <boost/process/v1.hpp>
#else
#include <boost/process.hpp>
#endif
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "nlohmann/json.hpp"
#include "sandbox/deadline_supervisor.hpp"
#include "utils/logging.hpp"

namespace codebox::sandbox {
#if __has_include(<boost/process/v1.hpp>)
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif

namespace {

constexpr const char* kBootstrap = R"PY(
import sys, json, types, importlib, importlib.util
import builtins as _host_builtins

_channel = sys.stdout


def _emit(record):
    _channel.write(json.dumps(record) + "\n")
    _channel.flush()


def _clean(text):
    return text.encode("utf-8", "replace").decode("utf-8")


def _describe(exc):
    try:
        return _clean(str(exc))
    except BaseException:
        return "<unprintable>"


def _report(exc, line):
    _emit({"t": "exc", "type": type(exc).__name__, "message": _describe(exc), "line": line or 0})


class _GuestStream:
    def __init__(self, tag, limit):
        self._tag = tag
        self._left = limit + 1

    def write(self, text):
        if not isinstance(text, str):
            raise TypeError("write() argument must be str, not " + type(text).__name__)
        if text and self._left > 0:
            chunk = text[:self._left]
            self._left -= len(chunk)
            _emit({"t": self._tag, "d": _clean(chunk)})
        return len(text)

    def writelines(self, lines):
        for line in lines:
            self.write(line)

    def flush(self):
        pass

    def isatty(self):
        return False

    def writable(self):
        return True

    @property
    def encoding(self):
        return "utf-8"


def _lazy_module(binding, module):
    loaded = []

    def load():
        if not loaded:
            loaded.append(importlib.import_module(module))
        return loaded[0]

    class _LazyModule(types.ModuleType):
        def __getattr__(self, attr):
            return getattr(load(), attr)

        def __dir__(self):
            return dir(load())

    return _LazyModule(binding)


def _is_dunder(name):
    return len(name) > 4 and name.startswith("__") and name.endswith("__")


def _code_names(code):
    for name in code.co_names:
        yield name
    for const in code.co_consts:
        if isinstance(const, types.CodeType):
            yield from _code_names(const)


def _main():
    request = json.loads(sys.stdin.buffer.read().decode("utf-8"))
    context = request["context"]
    limit = int(request["max_output_chars"])
    importable = set(context["importable"])
    guarded = set(context["guarded"])

    def refused(name):
        if name in guarded:
            return True
        return name.startswith("_") and not _is_dunder(name) and name.lstrip("_") in guarded

    def allowed(name):
        parts = name.split(".")
        return any(".".join(parts[:i]) in importable for i in range(1, len(parts) + 1))

    def guarded_import(name, globals=None, locals=None, fromlist=(), level=0):
        if level != 0:
            raise ImportError("relative imports are not allowed")
        if not allowed(name):
            if not fromlist or not all(allowed(name + "." + item) for item in fromlist):
                raise ImportError("import of '%s' is not allowed" % name)
        return _host_builtins.__import__(name, globals, locals, fromlist, level)

    safe = {}
    for name in context["builtins"]:
        if hasattr(_host_builtins, name):
            safe[name] = getattr(_host_builtins, name)
    safe["__import__"] = guarded_import

    namespace = {"__builtins__": safe, "__name__": "__main__"}
    for binding in context["modules"]:
        top = binding["module"].split(".")[0]
        try:
            if importlib.util.find_spec(top) is None:
                continue
        except (ImportError, ValueError):
            continue
        namespace[binding["name"]] = _lazy_module(binding["name"], binding["module"])

    sys.stdout = _GuestStream("out", limit)
    sys.stderr = _GuestStream("err", limit)

    try:
        code = compile(request["source"], "<snippet>", "exec")
    except SyntaxError as exc:
        _emit({"t": "exc", "type": type(exc).__name__, "message": _clean(exc.msg or ""), "line": exc.lineno or 0})
        return
    except Exception as exc:
        _report(exc, 0)
        return

    # co_names holds identifiers after NFKC folding.
    for name in _code_names(code):
        if refused(name):
            _emit({"t": "exc", "type": "PermissionError", "message": "blocked name '%s'" % _clean(name), "line": 0})
            return

    try:
        exec(code, namespace)
    except BaseException as exc:
        line = 0
        tb = exc.__traceback__
        while tb is not None:
            if tb.tb_frame.f_code.co_filename == "<snippet>":
                line = tb.tb_lineno
            tb = tb.tb_next
        _report(exc, line)
        return
    _emit({"t": "done"})


_main()
)PY";

std::atomic<unsigned long> g_worker_counter{0};
std::once_flag g_sigpipe_once;

void IgnoreSigpipe() {
    std::call_once(g_sigpipe_once, [] {
        ::signal(SIGPIPE, SIG_IGN);
    });
}

class ScopedTempFile {
public:
    explicit ScopedTempFile(const std::string& prefix) {
        const auto stamp = std::to_string(
            std::chrono::steady_clock::now().time_since_epoch().count());
        path_ = std::filesystem::temp_directory_path() /
            (prefix + std::to_string(::getpid()) + "_" + stamp + "_" +
             std::to_string(g_worker_counter.fetch_add(1)) + ".log");
    }

    ~ScopedTempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;

    const std::filesystem::path& Path() const { return path_; }

    std::string ReadTail(std::size_t max_bytes) const {
        std::ifstream input(path_);
        if (!input.is_open()) {
            return {};
        }
        std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
        if (content.size() > max_bytes) {
            content = content.substr(content.size() - max_bytes);
        }
        return content;
    }

private:
    std::filesystem::path path_;
};

bp::environment BuildWorkerEnvironment() {
    bp::environment env;
    const char* kPassThrough[] = {
        "PATH",
        "HOME",
        "PYENV_ROOT",
        "PYENV_VERSION"
    };
    for (const auto* key : kPassThrough) {
        if (const char* value = std::getenv(key)) {
            env[key] = value;
        }
    }
    env["LANG"] = "C.UTF-8";
    env["LC_ALL"] = "C.UTF-8";
    env["MPLBACKEND"] = "Agg";
    return env;
}

std::string DescribeExit(int exit_code) {
    if (exit_code > 128) {
        return "worker killed by signal " + std::to_string(exit_code - 128);
    }
    return "worker exited with status " + std::to_string(exit_code) + " before reporting";
}

}  // namespace

void WorkerHandle::Attach(pid_t pid) {
    std::lock_guard<std::mutex> lock(mutex_);
    pid_ = pid;
    reaped_ = false;
    if (kill_requested_) {
        ::kill(pid_, SIGKILL);
    }
}

void WorkerHandle::Kill() {
    std::lock_guard<std::mutex> lock(mutex_);
    kill_requested_ = true;
    if (pid_ > 0 && !reaped_) {
        ::kill(pid_, SIGKILL);
    }
}

bool WorkerHandle::KillRequested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return kill_requested_;
}

int WorkerHandle::Reap() {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (pid_ <= 0 || reaped_) {
                return -1;
            }
            int status = 0;
            const auto waited = ::waitpid(pid_, &status, WNOHANG);
            if (waited == pid_) {
                reaped_ = true;
                if (WIFEXITED(status)) {
                    return WEXITSTATUS(status);
                }
                if (WIFSIGNALED(status)) {
                    return 128 + WTERMSIG(status);
                }
                return -1;
            }
            if (waited < 0) {
                reaped_ = true;
                return -1;
            }
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

WorkerProcess::WorkerProcess(std::string python_executable)
    : python_executable_(std::move(python_executable)) {}

std::string WorkerProcess::ResolveExecutable() const {
    if (python_executable_.find('/') != std::string::npos) {
        return python_executable_;
    }
    const auto found = bp::search_path(python_executable_);
    if (found.empty()) {
        throw std::runtime_error("python interpreter not found: " + python_executable_);
    }
    return found.string();
}

WorkerReport WorkerProcess::Run(const WorkerRequest& request,
                                OutputCapture& capture,
                                WorkerHandle& handle) const {
    IgnoreSigpipe();
    const auto executable = ResolveExecutable();
    ScopedTempFile stderr_file("codebox_worker_");

    const nlohmann::json payload = {
        {"source", request.source},
        {"context", ToJson(request.context)},
        {"max_output_chars", request.max_output_chars}
    };

    bp::opstream to_worker;
    bp::ipstream from_worker;
    std::unique_ptr<bp::child> child;
    try {
        child = std::make_unique<bp::child>(
            executable,
            "-I",
            "-B",
            "-c",
            kBootstrap,
            BuildWorkerEnvironment(),
            bp::std_in < to_worker,
            bp::std_out > from_worker,
            bp::std_err > stderr_file.Path().string(),
            bp::limit_handles);
    } catch (const bp::process_error& ex) {
        throw std::runtime_error(std::string("cannot start python worker: ") + ex.what());
    }
    handle.Attach(child->id());
    utils::Log(utils::LogLevel::kDebug, "sandbox", "worker started",
               {{"pid", std::to_string(child->id())}});

    // error_handler replaces invalid UTF-8 from the guest instead of throwing.
    to_worker << payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    to_worker.flush();
    to_worker.close();

    bool finished = false;
    bool raised = false;
    std::string error_type;
    std::string error_message;
    int error_line = 0;
    std::string line;
    while (std::getline(from_worker, line)) {
        const auto record = nlohmann::json::parse(line, nullptr, false);
        if (record.is_discarded() || !record.is_object()) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "unreadable worker record",
                       {{"bytes", std::to_string(line.size())}});
            continue;
        }
        const auto tag = record.value("t", "");
        if (tag == "out") {
            capture.WriteStdout(record.value("d", ""));
        } else if (tag == "err") {
            capture.WriteStderr(record.value("d", ""));
        } else if (tag == "exc") {
            raised = true;
            error_type = record.value("type", "Exception");
            error_message = record.value("message", "");
            error_line = record.value("line", 0);
        } else if (tag == "done") {
            finished = true;
        }
    }

    WorkerReport report{};
    report.exit_code = handle.Reap();
    child->detach();
    report.finished = finished;

    if (raised) {
        throw GuestError(error_type, error_message, error_line);
    }
    if (!finished) {
        if (!handle.KillRequested()) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "worker failed",
                       {{"exit_code", std::to_string(report.exit_code)},
                        {"stderr", stderr_file.ReadTail(2000)}});
        }
        throw std::runtime_error(DescribeExit(report.exit_code));
    }
    return report;
}

}  // namespace codebox::sandbox
