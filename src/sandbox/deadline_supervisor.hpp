#pragma once

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace codebox::sandbox {

// Thrown by an attempt when the guest program itself failed.
class GuestError : public std::runtime_error {
public:
    GuestError(std::string type, std::string message, int line)
        : std::runtime_error(type + ": " + message)
        , type_(std::move(type))
        , message_(std::move(message))
        , line_(line) {}

    const std::string& Type() const { return type_; }
    const std::string& Message() const { return message_; }
    int Line() const { return line_; }

private:
    std::string type_;
    std::string message_;
    int line_;
};

enum class OutcomeKind {
    kCompleted,
    kRaised,
    kTimedOut,
    kFaulted
};

inline const char* ToString(OutcomeKind kind) {
    switch (kind) {
        case OutcomeKind::kCompleted: return "completed";
        case OutcomeKind::kRaised: return "raised";
        case OutcomeKind::kTimedOut: return "timed_out";
        case OutcomeKind::kFaulted: return "faulted";
    }
    return "unknown";
}

struct OutcomeStatus {
    OutcomeKind kind = OutcomeKind::kFaulted;
    std::string error_type;
    std::string message;
    int line = 0;
};

template <typename T>
struct Outcome : OutcomeStatus {
    std::optional<T> value;
};

// Runs `attempt` on its own thread and waits at most `limit` for it. On
// expiry `on_timeout` is called and TimedOut is returned at once; the
// abandoned thread finishes on its own and its result is discarded.
// A GuestError from the attempt is Raised, any other exception is Faulted.
template <typename T>
Outcome<T> RunWithDeadline(std::function<T()> attempt,
                           std::chrono::milliseconds limit,
                           std::function<void()> on_timeout) {
    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    try {
        std::thread([promise, attempt = std::move(attempt)]() mutable {
            try {
                promise->set_value(attempt());
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
    } catch (const std::exception& ex) {
        Outcome<T> outcome{};
        outcome.kind = OutcomeKind::kFaulted;
        outcome.message = std::string("cannot start attempt: ") + ex.what();
        return outcome;
    }

    Outcome<T> outcome{};
    if (future.wait_for(limit) != std::future_status::ready) {
        if (on_timeout) {
            on_timeout();
        }
        outcome.kind = OutcomeKind::kTimedOut;
        return outcome;
    }

    try {
        outcome.value = future.get();
        outcome.kind = OutcomeKind::kCompleted;
    } catch (const GuestError& ex) {
        outcome.kind = OutcomeKind::kRaised;
        outcome.error_type = ex.Type();
        outcome.message = ex.Message();
        outcome.line = ex.Line();
    } catch (const std::exception& ex) {
        outcome.kind = OutcomeKind::kFaulted;
        outcome.message = ex.what();
    } catch (...) {
        outcome.kind = OutcomeKind::kFaulted;
        outcome.message = "unknown failure";
    }
    return outcome;
}

}  // namespace codebox::sandbox
