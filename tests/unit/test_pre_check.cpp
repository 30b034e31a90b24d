#include <set>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "config/config_schema.hpp"
#include "sandbox/policy.hpp"
#include "sandbox/pre_check.hpp"

namespace {

using codebox::sandbox::Check;
using codebox::sandbox::DescribeViolations;
using codebox::sandbox::Policy;
using codebox::sandbox::Violation;
using codebox::sandbox::ViolationKind;

std::shared_ptr<const Policy> DefaultPolicy() {
    return Policy::FromConfig(codebox::config::SandboxConfig{});
}

std::vector<std::string> Identifiers(const std::vector<Violation>& violations, ViolationKind kind) {
    std::vector<std::string> identifiers;
    for (const auto& violation : violations) {
        if (violation.kind == kind) {
            identifiers.push_back(violation.identifier);
        }
    }
    return identifiers;
}

TEST(PreCheckTest, CleanSourcePasses) {
    const auto policy = DefaultPolicy();
    const auto source =
        "import math\n"
        "from collections import Counter\n"
        "import matplotlib.pyplot as plt\n"
        "words = 'a b a'.split()\n"
        "print(Counter(words).most_common(1), math.sqrt(16))\n"
        "pattern = re.compile(r'\\d+')\n";
    EXPECT_TRUE(Check(source, *policy).empty());
}

TEST(PreCheckTest, ListsEveryDisallowedImportOnce) {
    const auto policy = DefaultPolicy();
    const auto source =
        "import os\n"
        "import subprocess, socket as s\n"
        "from shutil import rmtree\n"
        "import os\n";
    const auto violations = Check(source, *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kDisallowedImport),
              (std::vector<std::string>{"os", "subprocess", "socket", "shutil"}));
    EXPECT_TRUE(Identifiers(violations, ViolationKind::kBlockedName).empty());
}

TEST(PreCheckTest, ReportsBlockedNamesInSourceOrder) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("x = eval('1')\nf = open('x')\ny = eval('2')\n", *policy);
    ASSERT_EQ(violations.size(), 2u);
    EXPECT_EQ(violations[0].identifier, "eval");
    EXPECT_EQ(violations[0].line, 1);
    EXPECT_EQ(violations[1].identifier, "open");
    EXPECT_EQ(violations[1].line, 2);
}

TEST(PreCheckTest, IgnoresNamesInsideCommentsAndStrings) {
    const auto policy = DefaultPolicy();
    const auto source =
        "# import os and eval are fine in a comment\n"
        "print(\"eval(open('x'))\")\n"
        "doc = '''exec here too'''\n";
    EXPECT_TRUE(Check(source, *policy).empty());
}

TEST(PreCheckTest, ScansFStringExpressions) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("print(f\"{eval('1+1')}\")\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kBlockedName), (std::vector<std::string>{"eval"}));
}

TEST(PreCheckTest, AttributeEscapesAreBlocked) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("().__class__.__bases__[0].__subclasses__()\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kBlockedName),
              (std::vector<std::string>{"__class__", "__bases__", "__subclasses__"}));
}

TEST(PreCheckTest, OrdinaryAttributesSharingABlockedNameAreAllowed) {
    const auto policy = DefaultPolicy();
    EXPECT_TRUE(Check("import re\nrx = re.compile('a')\n", *policy).empty());
}

TEST(PreCheckTest, FullWidthIdentifiersAreBlocked) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("print(().__ｃlass__)\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kBlockedName), (std::vector<std::string>{"__ｃlass__"}));
    EXPECT_FALSE(Check("ｅval('1')\n", *policy).empty());
}

TEST(PreCheckTest, ModuleNamesReachedThroughAllowedModulesAreBlocked) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("print(datetime.sys.modules['os'].popen('id').read())\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kBlockedName), (std::vector<std::string>{"sys"}));
    EXPECT_EQ(Identifiers(Check("json.decoder.builtins\n", *policy), ViolationKind::kBlockedName),
              (std::vector<std::string>{"builtins"}));
}

TEST(PreCheckTest, PrivateModuleAliasesAreBlocked) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("random._os.system('id')\nre._sys\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kBlockedName), (std::vector<std::string>{"_os", "_sys"}));
    EXPECT_TRUE(Check("x = random._inst\n", *policy).empty());
}

TEST(PreCheckTest, DunderInFormatStringIsBlocked) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("print('{0.__class__}'.format(1))\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kBlockedName), (std::vector<std::string>{"__class__"}));
}

TEST(PreCheckTest, RelativeImportsAreDisallowed) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("from . import helpers\nfrom ..pkg import x\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kDisallowedImport),
              (std::vector<std::string>{".", "..pkg"}));
}

TEST(PreCheckTest, FromImportOfAllowedSubmodule) {
    const auto policy = DefaultPolicy();
    EXPECT_TRUE(Check("from matplotlib import pyplot\n", *policy).empty());
    const auto violations = Check("from matplotlib import pyplot, cm\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kDisallowedImport),
              (std::vector<std::string>{"matplotlib.cm"}));
}

TEST(PreCheckTest, DottedImportUnderAllowedPackage) {
    const auto policy = DefaultPolicy();
    EXPECT_TRUE(Check("import json.decoder\nfrom collections.abc import Mapping\n", *policy).empty());
    const auto violations = Check("import os.path\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kDisallowedImport), (std::vector<std::string>{"os.path"}));
}

TEST(PreCheckTest, YieldFromAndRaiseFromAreNotImports) {
    const auto policy = DefaultPolicy();
    const auto source =
        "def gen(items):\n"
        "    yield from items\n"
        "try:\n"
        "    pass\n"
        "except ValueError as err:\n"
        "    raise RuntimeError('x') from err\n";
    EXPECT_TRUE(Check(source, *policy).empty());
}

TEST(PreCheckTest, ImportInsideBlockIsChecked) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("if True: import sys\n", *policy);
    EXPECT_EQ(Identifiers(violations, ViolationKind::kDisallowedImport), (std::vector<std::string>{"sys"}));
}

TEST(PreCheckTest, DescribesViolations) {
    const auto policy = DefaultPolicy();
    const auto violations = Check("import os\neval('1')\n", *policy);
    EXPECT_EQ(DescribeViolations(violations), "disallowed import 'os'; blocked name 'eval'");
}

TEST(PreCheckTest, RespectsCustomPolicy) {
    const Policy policy({"os"}, {"print"}, 1.0, 100);
    const auto violations = Check("import os\nprint(os.getcwd())\n", policy);
    ASSERT_EQ(violations.size(), 1u);
    EXPECT_EQ(violations[0].kind, ViolationKind::kBlockedName);
    EXPECT_EQ(violations[0].identifier, "print");
}

}  // namespace
