#pragma once

#include <string>
#include <vector>

namespace codebox::sandbox {

enum class TokenKind {
    kName,
    kString,
    kNumber,
    kOperator,
    kNewline
};

struct Token {
    TokenKind kind = TokenKind::kOperator;
    std::string text;
    int line = 1;
    bool is_fstring = false;
};

// Lexical pass over Python source. Comments are dropped, string literals
// become a single kString token holding the literal body, and the
// replacement fields of f-strings are scanned as code and emitted after the
// literal token. kNewline marks the end of a logical line (never emitted
// inside brackets or after a backslash continuation). Malformed input is
// scanned on a best-effort basis and never rejected.
std::vector<Token> ScanSource(const std::string& source);

}  // namespace codebox::sandbox
