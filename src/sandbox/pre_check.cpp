#include "sandbox/pre_check.hpp"

#include <regex>
#include <set>
#include <utility>

#include "sandbox/source_scanner.hpp"

namespace codebox::sandbox {
namespace {

// Python folds identifiers with NFKC, so `__ｃlass__` names `__class__`.
bool IsAsciiName(const std::string& name) {
    for (unsigned char c : name) {
        if (c >= 0x80) {
            return false;
        }
    }
    return true;
}

bool IsOperator(const Token& token, const char* text) {
    return token.kind == TokenKind::kOperator && token.text == text;
}

bool IsStatementEnd(const Token& token) {
    return token.kind == TokenKind::kNewline || IsOperator(token, ";");
}

class ViolationSink {
public:
    void Add(ViolationKind kind, const std::string& identifier, int line) {
        if (seen_.insert({kind, identifier}).second) {
            violations_.push_back(Violation{kind, identifier, line});
        }
    }

    std::vector<Violation> Take() { return std::move(violations_); }

private:
    std::set<std::pair<ViolationKind, std::string>> seen_;
    std::vector<Violation> violations_;
};

class ImportParser {
public:
    ImportParser(const std::vector<Token>& tokens,
                 std::vector<bool>& consumed,
                 const Policy& policy,
                 ViolationSink& sink)
        : tokens_(tokens)
        , consumed_(consumed)
        , policy_(policy)
        , sink_(sink) {}

    // `import a.b as c, d`
    void ParseImport(std::size_t at) {
        consumed_[at] = true;
        std::size_t i = at + 1;
        while (i < tokens_.size()) {
            std::string module;
            const int line = tokens_[i].line;
            i = ReadDottedName(i, module);
            if (module.empty()) {
                break;
            }
            if (!policy_.IsImportAllowed(module)) {
                sink_.Add(ViolationKind::kDisallowedImport, module, line);
            }
            i = SkipAlias(i);
            if (i < tokens_.size() && IsOperator(tokens_[i], ",")) {
                consumed_[i] = true;
                ++i;
                continue;
            }
            break;
        }
    }

    // `from a.b import x, y`. Returns false when `from` does not start an
    // import statement (`yield from`, `raise ... from`).
    bool ParseFrom(std::size_t at) {
        std::size_t i = at + 1;
        std::string module;
        while (i < tokens_.size() && IsOperator(tokens_[i], ".")) {
            module.push_back('.');
            ++i;
        }
        const bool relative = !module.empty();
        std::string dotted;
        i = ReadDottedName(i, dotted, false);
        module += dotted;
        if (module.empty() || i >= tokens_.size() ||
            tokens_[i].kind != TokenKind::kName || tokens_[i].text != "import") {
            return false;
        }
        for (std::size_t k = at; k <= i; ++k) {
            consumed_[k] = true;
        }
        const int line = tokens_[at].line;
        ++i;

        std::vector<std::string> names;
        if (i < tokens_.size() && IsOperator(tokens_[i], "(")) {
            consumed_[i] = true;
            ++i;
        }
        while (i < tokens_.size() && !IsStatementEnd(tokens_[i])) {
            const auto& token = tokens_[i];
            if (IsOperator(token, ")")) {
                consumed_[i] = true;
                break;
            }
            if (token.kind == TokenKind::kName || IsOperator(token, "*")) {
                consumed_[i] = true;
                names.push_back(token.text);
                i = SkipAlias(i + 1);
                continue;
            }
            if (IsOperator(token, ",")) {
                consumed_[i] = true;
            }
            ++i;
        }

        if (relative) {
            sink_.Add(ViolationKind::kDisallowedImport, module, line);
            return true;
        }
        if (policy_.IsImportAllowed(module)) {
            return true;
        }
        std::vector<std::string> rejected;
        for (const auto& name : names) {
            if (name == "*" || !policy_.IsImportAllowed(module + "." + name)) {
                rejected.push_back(name);
            }
        }
        if (names.empty() || rejected.size() == names.size()) {
            sink_.Add(ViolationKind::kDisallowedImport, module, line);
            return true;
        }
        for (const auto& name : rejected) {
            sink_.Add(ViolationKind::kDisallowedImport, module + "." + name, line);
        }
        return true;
    }

private:
    std::size_t ReadDottedName(std::size_t i, std::string& out, bool mark = true) {
        while (i < tokens_.size() && tokens_[i].kind == TokenKind::kName) {
            if (mark) {
                consumed_[i] = true;
            }
            out += tokens_[i].text;
            ++i;
            if (i + 1 < tokens_.size() && IsOperator(tokens_[i], ".") &&
                tokens_[i + 1].kind == TokenKind::kName) {
                if (mark) {
                    consumed_[i] = true;
                }
                out.push_back('.');
                ++i;
                continue;
            }
            break;
        }
        return i;
    }

    std::size_t SkipAlias(std::size_t i) {
        if (i + 1 < tokens_.size() && tokens_[i].kind == TokenKind::kName && tokens_[i].text == "as" &&
            tokens_[i + 1].kind == TokenKind::kName) {
            consumed_[i] = true;
            consumed_[i + 1] = true;
            return i + 2;
        }
        return i;
    }

    const std::vector<Token>& tokens_;
    std::vector<bool>& consumed_;
    const Policy& policy_;
    ViolationSink& sink_;
};

void CheckStringLiteral(const Token& token, const Policy& policy, ViolationSink& sink) {
    static const std::regex kDunderAttribute(R"(\.\s*(__[A-Za-z0-9_]+__))");
    for (std::sregex_iterator it(token.text.begin(), token.text.end(), kDunderAttribute), end;
         it != end; ++it) {
        const auto name = (*it)[1].str();
        if (policy.IsBlocked(name)) {
            sink.Add(ViolationKind::kBlockedName, name, token.line);
        }
    }
}

}  // namespace

std::vector<Violation> Check(const std::string& source, const Policy& policy) {
    const auto tokens = ScanSource(source);
    std::vector<bool> consumed(tokens.size(), false);
    ViolationSink sink;
    ImportParser imports(tokens, consumed, policy, sink);

    for (std::size_t i = 0; i < tokens.size(); ++i) {
        const auto& token = tokens[i];
        if (token.kind == TokenKind::kName && !IsAsciiName(token.text)) {
            sink.Add(ViolationKind::kBlockedName, token.text, token.line);
            continue;
        }
        if (consumed[i]) {
            continue;
        }
        if (token.kind == TokenKind::kString) {
            CheckStringLiteral(token, policy, sink);
            continue;
        }
        if (token.kind != TokenKind::kName) {
            continue;
        }
        const bool attribute = i > 0 && IsOperator(tokens[i - 1], ".");
        if (!attribute && token.text == "import") {
            imports.ParseImport(i);
            continue;
        }
        if (!attribute && token.text == "from" && imports.ParseFrom(i)) {
            continue;
        }
        const bool blocked = attribute ? policy.IsBlockedAttribute(token.text) : policy.IsBlocked(token.text);
        if (blocked) {
            sink.Add(ViolationKind::kBlockedName, token.text, token.line);
        }
    }
    return sink.Take();
}

std::string DescribeViolations(const std::vector<Violation>& violations) {
    std::string text;
    for (const auto& violation : violations) {
        if (!text.empty()) {
            text += "; ";
        }
        text += ToString(violation.kind);
        text += " '" + violation.identifier + "'";
    }
    return text;
}

}  // namespace codebox::sandbox
