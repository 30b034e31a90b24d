#include "sandbox/source_scanner.hpp"

#include <cctype>

namespace codebox::sandbox {
namespace {

bool IsNameStart(unsigned char c) {
    return std::isalpha(c) || c == '_' || c >= 0x80;
}

bool IsNameChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

bool IsStringPrefix(const std::string& word) {
    std::string lowered;
    for (unsigned char c : word) {
        lowered.push_back(static_cast<char>(std::tolower(c)));
    }
    return lowered == "r" || lowered == "u" || lowered == "b" || lowered == "f" ||
        lowered == "br" || lowered == "rb" || lowered == "fr" || lowered == "rf";
}

class Scanner {
public:
    Scanner(const std::string& source, int first_line, bool emit_newlines)
        : src_(source)
        , line_(first_line)
        , emit_newlines_(emit_newlines) {}

    std::vector<Token> Run() {
        while (pos_ < src_.size()) {
            const unsigned char c = static_cast<unsigned char>(src_[pos_]);
            if (c == ' ' || c == '\t' || c == '\f') {
                ++pos_;
            } else if (c == '\\' && IsLineBreakAt(pos_ + 1)) {
                ++pos_;
                SkipLineBreak();
            } else if (c == '\r' || c == '\n') {
                SkipLineBreak();
                if (depth_ == 0) {
                    EmitNewline(line_ - 1);
                }
            } else if (c == '#') {
                while (pos_ < src_.size() && src_[pos_] != '\n' && src_[pos_] != '\r') {
                    ++pos_;
                }
            } else if (IsNameStart(c)) {
                ScanWord();
            } else if (std::isdigit(c) || (c == '.' && pos_ + 1 < src_.size() &&
                                           std::isdigit(static_cast<unsigned char>(src_[pos_ + 1])))) {
                ScanNumber();
            } else if (c == '"' || c == '\'') {
                ScanString(std::string());
            } else {
                ScanOperator(static_cast<char>(c));
            }
        }
        if (depth_ == 0) {
            EmitNewline(line_);
        }
        return std::move(tokens_);
    }

private:
    bool IsLineBreakAt(std::size_t at) const {
        return at < src_.size() && (src_[at] == '\n' || src_[at] == '\r');
    }

    void SkipLineBreak() {
        if (src_[pos_] == '\r' && pos_ + 1 < src_.size() && src_[pos_ + 1] == '\n') {
            ++pos_;
        }
        ++pos_;
        ++line_;
    }

    void EmitNewline(int line) {
        if (!emit_newlines_) {
            return;
        }
        if (tokens_.empty() || tokens_.back().kind == TokenKind::kNewline) {
            return;
        }
        tokens_.push_back(Token{TokenKind::kNewline, "", line, false});
    }

    void ScanWord() {
        const auto start = pos_;
        while (pos_ < src_.size() && IsNameChar(static_cast<unsigned char>(src_[pos_]))) {
            ++pos_;
        }
        auto word = src_.substr(start, pos_ - start);
        if (pos_ < src_.size() && (src_[pos_] == '"' || src_[pos_] == '\'') && IsStringPrefix(word)) {
            ScanString(word);
            return;
        }
        tokens_.push_back(Token{TokenKind::kName, std::move(word), line_, false});
    }

    void ScanDigits(bool hex) {
        while (pos_ < src_.size()) {
            const unsigned char c = static_cast<unsigned char>(src_[pos_]);
            if (std::isdigit(c) || c == '_' || (hex && std::isxdigit(c))) {
                ++pos_;
            } else {
                break;
            }
        }
    }

    void ScanNumber() {
        const auto start = pos_;
        if (src_[pos_] == '0' && pos_ + 1 < src_.size() &&
            std::string("xXoObB").find(src_[pos_ + 1]) != std::string::npos) {
            pos_ += 2;
            ScanDigits(true);
        } else {
            ScanDigits(false);
            if (pos_ < src_.size() && src_[pos_] == '.') {
                ++pos_;
                ScanDigits(false);
            }
            if (pos_ < src_.size() && (src_[pos_] == 'e' || src_[pos_] == 'E')) {
                auto probe = pos_ + 1;
                if (probe < src_.size() && (src_[probe] == '+' || src_[probe] == '-')) {
                    ++probe;
                }
                if (probe < src_.size() && std::isdigit(static_cast<unsigned char>(src_[probe]))) {
                    pos_ = probe;
                    ScanDigits(false);
                }
            }
            if (pos_ < src_.size() && (src_[pos_] == 'j' || src_[pos_] == 'J')) {
                ++pos_;
            }
        }
        tokens_.push_back(Token{TokenKind::kNumber, src_.substr(start, pos_ - start), line_, false});
    }

    void ScanOperator(char c) {
        if (c == '(' || c == '[' || c == '{') {
            ++depth_;
        } else if ((c == ')' || c == ']' || c == '}') && depth_ > 0) {
            --depth_;
        }
        tokens_.push_back(Token{TokenKind::kOperator, std::string(1, c), line_, false});
        ++pos_;
    }

    bool AtClosingQuote(char quote, bool triple) const {
        if (src_[pos_] != quote) {
            return false;
        }
        if (!triple) {
            return true;
        }
        return pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote;
    }

    void ScanString(const std::string& prefix) {
        bool fstring = false;
        for (char p : prefix) {
            if (p == 'f' || p == 'F') {
                fstring = true;
            }
        }
        const char quote = src_[pos_];
        const bool triple = pos_ + 2 < src_.size() && src_[pos_ + 1] == quote && src_[pos_ + 2] == quote;
        pos_ += triple ? 3 : 1;
        const int start_line = line_;
        const auto body_start = pos_;
        std::vector<Token> fields;

        auto body_end = src_.size();
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (c == '\\') {
                ++pos_;
                if (pos_ < src_.size()) {
                    if (IsLineBreakAt(pos_)) {
                        SkipLineBreak();
                    } else {
                        ++pos_;
                    }
                }
                continue;
            }
            if (AtClosingQuote(quote, triple)) {
                body_end = pos_;
                pos_ += triple ? 3 : 1;
                break;
            }
            if (c == '\n' || c == '\r') {
                if (!triple) {
                    body_end = pos_;
                    break;
                }
                SkipLineBreak();
                continue;
            }
            if (fstring && c == '{') {
                if (pos_ + 1 < src_.size() && src_[pos_ + 1] == '{') {
                    pos_ += 2;
                    continue;
                }
                ScanReplacementField(quote, triple, fields);
                continue;
            }
            ++pos_;
        }

        tokens_.push_back(Token{
            TokenKind::kString,
            src_.substr(body_start, body_end - body_start),
            start_line,
            fstring});
        tokens_.insert(tokens_.end(), fields.begin(), fields.end());
    }

    // Positioned on '{'. Consumes through the matching '}' and scans the
    // enclosed expression as code.
    void ScanReplacementField(char quote, bool triple, std::vector<Token>& out) {
        ++pos_;
        const auto field_start = pos_;
        const int field_line = line_;
        int nesting = 0;
        while (pos_ < src_.size()) {
            const char c = src_[pos_];
            if (AtClosingQuote(quote, triple)) {
                break;
            }
            if (c == '\n' || c == '\r') {
                if (!triple) {
                    break;
                }
                SkipLineBreak();
                continue;
            }
            if (c == '\'' || c == '"') {
                SkipNestedString(c);
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                ++nesting;
            } else if (c == ')' || c == ']') {
                if (nesting > 0) {
                    --nesting;
                }
            } else if (c == '}') {
                if (nesting == 0) {
                    break;
                }
                --nesting;
            }
            ++pos_;
        }
        const auto field_text = src_.substr(field_start, pos_ - field_start);
        if (pos_ < src_.size() && src_[pos_] == '}') {
            ++pos_;
        }
        auto inner = Scanner(field_text, field_line, false).Run();
        out.insert(out.end(), inner.begin(), inner.end());
    }

    void SkipNestedString(char quote) {
        ++pos_;
        while (pos_ < src_.size() && src_[pos_] != quote && src_[pos_] != '\n') {
            if (src_[pos_] == '\\') {
                ++pos_;
            }
            ++pos_;
        }
        if (pos_ < src_.size() && src_[pos_] == quote) {
            ++pos_;
        }
    }

    const std::string& src_;
    std::size_t pos_ = 0;
    int line_ = 1;
    int depth_ = 0;
    bool emit_newlines_ = true;
    std::vector<Token> tokens_;
};

}  // namespace

std::vector<Token> ScanSource(const std::string& source) {
    return Scanner(source, 1, true).Run();
}

}  // namespace codebox::sandbox
