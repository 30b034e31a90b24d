#pragma once

#include <cstddef>
#include <mutex>
#include <string>

namespace codebox::sandbox {

// Text buffer capped at a number of Unicode code points.
class BoundedBuffer {
public:
    explicit BoundedBuffer(std::size_t max_chars);

    // Appends what still fits. Returns false when anything was dropped.
    bool Append(const std::string& text);

    const std::string& Text() const { return text_; }
    std::size_t CharCount() const { return chars_; }
    bool Truncated() const { return truncated_; }

private:
    std::size_t max_chars_;
    std::size_t chars_ = 0;
    bool truncated_ = false;
    std::string text_;
};

// Captured guest output for a single run. Thread-safe; once sealed every
// write is ignored.
class OutputCapture {
public:
    struct Snapshot {
        std::string stdout_text;
        std::string stderr_text;
        // Set when stdout was cut at the cap.
        bool truncated = false;
    };

    explicit OutputCapture(std::size_t max_chars);

    void WriteStdout(const std::string& text);
    void WriteStderr(const std::string& text);

    void Seal();
    bool Sealed() const;

    Snapshot Take() const;

private:
    mutable std::mutex mutex_;
    BoundedBuffer out_;
    BoundedBuffer err_;
    bool sealed_ = false;
};

}  // namespace codebox::sandbox
