#include "sandbox/output_capture.hpp"

namespace codebox::sandbox {
namespace {

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

}  // namespace

BoundedBuffer::BoundedBuffer(std::size_t max_chars)
    : max_chars_(max_chars) {}

bool BoundedBuffer::Append(const std::string& text) {
    if (truncated_) {
        return text.empty();
    }
    std::size_t i = 0;
    for (; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (IsContinuationByte(c)) {
            continue;
        }
        if (chars_ == max_chars_) {
            truncated_ = true;
            break;
        }
        ++chars_;
    }
    text_.append(text, 0, i);
    return !truncated_;
}

OutputCapture::OutputCapture(std::size_t max_chars)
    : out_(max_chars)
    , err_(max_chars) {}

void OutputCapture::WriteStdout(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sealed_) {
        out_.Append(text);
    }
}

void OutputCapture::WriteStderr(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sealed_) {
        err_.Append(text);
    }
}

void OutputCapture::Seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
}

bool OutputCapture::Sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

OutputCapture::Snapshot OutputCapture::Take() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return Snapshot{out_.Text(), err_.Text(), out_.Truncated()};
}

}  // namespace codebox::sandbox
