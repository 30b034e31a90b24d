#pragma once

#include <string>
#include <vector>

#include "sandbox/policy.hpp"

namespace codebox::sandbox {

enum class ViolationKind {
    kBlockedName,
    kDisallowedImport
};

inline const char* ToString(ViolationKind kind) {
    switch (kind) {
        case ViolationKind::kBlockedName: return "blocked name";
        case ViolationKind::kDisallowedImport: return "disallowed import";
    }
    return "unknown";
}

struct Violation {
    ViolationKind kind = ViolationKind::kBlockedName;
    std::string identifier;
    int line = 0;
};

// Lexical policy check. Returns each distinct (kind, identifier) pair once,
// in order of first appearance; an empty result means the source passes.
std::vector<Violation> Check(const std::string& source, const Policy& policy);

// "disallowed import 'os'; blocked name 'eval'"
std::string DescribeViolations(const std::vector<Violation>& violations);

}  // namespace codebox::sandbox
