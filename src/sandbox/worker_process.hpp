#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <sys/types.h>

#include "sandbox/execution_context.hpp"
#include "sandbox/output_capture.hpp"

namespace codebox::sandbox {

struct WorkerRequest {
    std::string source;
    ExecutionContext context;
    std::size_t max_output_chars = 0;
};

struct WorkerReport {
    bool finished = false;
    int exit_code = -1;
};

// Shared between the attempt thread, which spawns and reaps the worker, and
// the supervisor, which may kill it. A pid is only signalled while it is
// known not to have been reaped.
class WorkerHandle {
public:
    void Attach(pid_t pid);
    void Kill();
    bool KillRequested() const;

    // Polls until the attached worker has exited. Returns its exit status
    // (128 + signal for a signalled worker).
    int Reap();

private:
    mutable std::mutex mutex_;
    pid_t pid_ = -1;
    bool reaped_ = false;
    bool kill_requested_ = false;
};

// Runs one snippet in a `python3 -I -B -c <bootstrap>` child process.
class WorkerProcess {
public:
    explicit WorkerProcess(std::string python_executable);

    // Streams the worker's output into `capture`. Throws GuestError when the
    // snippet raised and std::runtime_error when the worker could not start or
    // died without reporting.
    WorkerReport Run(const WorkerRequest& request, OutputCapture& capture, WorkerHandle& handle) const;

private:
    std::string ResolveExecutable() const;

    std::string python_executable_;
};

}  // namespace codebox::sandbox
