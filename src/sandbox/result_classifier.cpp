#include "sandbox/result_classifier.hpp"

#include <regex>
#include <sstream>

#include "utils/common.hpp"

namespace codebox::sandbox {
namespace {

constexpr std::size_t kMaxErrorLines = 10;
constexpr std::size_t kMaxErrorChars = 2000;

// Cuts `text` after `max_chars` code points.
std::string CutAtCodePoints(const std::string& text, std::size_t max_chars) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if ((c & 0xC0) == 0x80) {
            continue;
        }
        if (chars == max_chars) {
            return text.substr(0, i);
        }
        ++chars;
    }
    return text;
}

std::string FormatGuestError(const OutcomeStatus& outcome) {
    std::string text = outcome.error_type.empty() ? std::string("Error") : outcome.error_type;
    if (!outcome.message.empty()) {
        text += ": " + outcome.message;
    }
    if (outcome.line > 0) {
        text += " (line " + std::to_string(outcome.line) + ")";
    }
    return text;
}

ExecutionResult Failure(std::string output, std::string error, double elapsed_seconds) {
    ExecutionResult result{};
    result.success = false;
    result.output = std::move(output);
    result.error = std::move(error);
    result.execution_time_seconds = elapsed_seconds;
    return result;
}

}  // namespace

std::string SanitizeErrorMessage(const std::string& message) {
    static const std::regex kFrame(R"re(File "[^"]*", line \d+(, in [^\s,]+)?,?\s*)re");
    static const std::regex kAbsolutePath(R"re((^|[\s'"(\[=<])/(?:[A-Za-z0-9._\-]+/?)+)re");

    std::istringstream lines(message);
    std::string line;
    std::string kept;
    std::size_t count = 0;
    while (count < kMaxErrorLines && std::getline(lines, line)) {
        if (count > 0) {
            kept.push_back('\n');
        }
        kept += line;
        ++count;
    }

    auto text = std::regex_replace(CutAtCodePoints(kept, kMaxErrorChars), kFrame, "");
    text = std::regex_replace(text, kAbsolutePath, "$1<path>");
    return codebox::utils::Trim(CutAtCodePoints(text, kMaxErrorChars));
}

std::string FormatTimeLimit(double seconds) {
    std::ostringstream oss;
    oss << seconds;
    return oss.str();
}

ExecutionResult ClassifyEmpty(double elapsed_seconds) {
    return Failure("", "No code provided", elapsed_seconds);
}

ExecutionResult ClassifyViolations(const std::vector<Violation>& violations, double elapsed_seconds) {
    return Failure("", "Security policy violation: " + DescribeViolations(violations), elapsed_seconds);
}

ExecutionResult ClassifyOutcome(const OutcomeStatus& outcome,
                                const OutputCapture::Snapshot& captured,
                                const Policy& policy,
                                double elapsed_seconds) {
    ExecutionResult result{};
    switch (outcome.kind) {
        case OutcomeKind::kCompleted:
            result.success = true;
            result.output = captured.stdout_text;
            result.execution_time_seconds = elapsed_seconds;
            break;
        case OutcomeKind::kRaised:
            result = Failure(captured.stdout_text,
                             SanitizeErrorMessage(FormatGuestError(outcome)),
                             elapsed_seconds);
            break;
        case OutcomeKind::kTimedOut:
            result = Failure(captured.stdout_text,
                             "Code execution timed out after " +
                                 FormatTimeLimit(policy.MaxExecutionSeconds()) + " seconds",
                             elapsed_seconds);
            break;
        case OutcomeKind::kFaulted:
            result = Failure(captured.stdout_text,
                             "Sandbox failure: " + SanitizeErrorMessage(outcome.message),
                             elapsed_seconds);
            break;
    }
    result.output_truncated = captured.truncated;
    result.stderr_output = captured.stderr_text;
    return result;
}

}  // namespace codebox::sandbox
