#include <execgate/core/validator.hpp>

#include <gtest/gtest.h>

using namespace execgate;

namespace {

class ValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        policy_.whitelist = {"ls", "git", "python3"};
        policy_.max_arg_count = 5;
        policy_.max_arg_len = 32;
    }

    ValidationOutcome check(const std::string& program, const std::vector<std::string>& args) {
        return CommandValidator::validate(CommandRequest(program, args), policy_);
    }

    Policy policy_;
};

} // namespace

TEST_F(ValidatorTest, AcceptsWhitelistedCommand) {
    ValidationOutcome v = check("ls", {"-la", "src"});
    EXPECT_TRUE(v.accepted);
    EXPECT_EQ(v.kind, ErrorKind::NONE);
    EXPECT_EQ(v.request.program, "ls");
    EXPECT_EQ(v.request.args, (std::vector<std::string>{"-la", "src"}));
}

TEST_F(ValidatorTest, AcceptsNoArguments) {
    EXPECT_TRUE(check("git", {}).accepted);
}

TEST_F(ValidatorTest, RejectsProgramNotOnWhitelist) {
    ValidationOutcome v = check("rm", {"-rf", "/"});
    EXPECT_FALSE(v.accepted);
    EXPECT_EQ(v.kind, ErrorKind::NOT_WHITELISTED);
    EXPECT_EQ(v.reason, "Command not allowed: rm");
}

TEST_F(ValidatorTest, WhitelistMatchIsExact) {
    EXPECT_EQ(check("LS", {}).kind, ErrorKind::NOT_WHITELISTED);
    EXPECT_EQ(check("/bin/ls", {}).kind, ErrorKind::NOT_WHITELISTED);
    EXPECT_EQ(check("ls ", {}).kind, ErrorKind::NOT_WHITELISTED);
    EXPECT_EQ(check("python", {}).kind, ErrorKind::NOT_WHITELISTED);
}

TEST_F(ValidatorTest, ArgumentCountBoundary) {
    EXPECT_TRUE(check("ls", {"a", "b", "c", "d", "e"}).accepted);

    ValidationOutcome v = check("ls", {"a", "b", "c", "d", "e", "f"});
    EXPECT_EQ(v.kind, ErrorKind::TOO_MANY_ARGUMENTS);
    EXPECT_EQ(v.reason, "Too many arguments: 6 (max: 5)");
}

TEST_F(ValidatorTest, ArgumentLengthBoundaryInBytes) {
    EXPECT_TRUE(check("ls", {std::string(32, 'a')}).accepted);

    ValidationOutcome v = check("ls", {"ok", std::string(33, 'a')});
    EXPECT_EQ(v.kind, ErrorKind::ARGUMENT_TOO_LONG);
    EXPECT_EQ(v.reason, "Argument 1 too long: 33 bytes (max: 32)");

    // 22 characters but 33 bytes
    std::string wide;
    for (int i = 0; i < 11; ++i) wide += "\xc3\xa9\x61";
    EXPECT_EQ(check("ls", {wide}).kind, ErrorKind::ARGUMENT_TOO_LONG);
}

TEST_F(ValidatorTest, RejectsEveryShellMetacharacter) {
    const std::string chars = CommandValidator::dangerous_characters();
    ASSERT_EQ(chars.size(), 7u);
    for (size_t i = 0; i < chars.size(); ++i) {
        std::string arg = std::string("a") + chars[i] + "b";
        ValidationOutcome v = check("ls", {arg});
        EXPECT_EQ(v.kind, ErrorKind::DANGEROUS_CHARACTER) << "character index " << i;
    }
}

TEST_F(ValidatorTest, ReasonDoesNotEchoArgumentValue) {
    ValidationOutcome v = check("ls", {"s3cr3t-value;x"});
    EXPECT_EQ(v.kind, ErrorKind::DANGEROUS_CHARACTER);
    EXPECT_EQ(v.reason.find("s3cr3t"), std::string::npos);
    EXPECT_NE(v.reason.find("';'"), std::string::npos);

    ValidationOutcome nl = check("ls", {"a\nb"});
    EXPECT_NE(nl.reason.find("'\\n'"), std::string::npos);
}

TEST_F(ValidatorTest, RejectsDenylistedSubstrings) {
    EXPECT_EQ(check("python3", {"-c", "import shutil, x"}).kind, ErrorKind::NONE);
    EXPECT_EQ(check("python3", {"-c", "shutil.rmtree('x')"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("python3", {"-c", "__import__('os')"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("python3", {"-c", "eval(input())"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("python3", {"-c", "import subprocess"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("python3", {"-c", "os.system('id')"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("git", {"rm -rf x"}).kind, ErrorKind::DANGEROUS_PATTERN);

    ValidationOutcome v = check("git", {"log", "rm -fr x"});
    EXPECT_EQ(v.reason, "Dangerous pattern in argument 1: rm -fr");
}

TEST_F(ValidatorTest, DenylistIsCaseSensitive) {
    EXPECT_TRUE(check("git", {"RM -RF"}).accepted);
    EXPECT_TRUE(check("git", {"SubProcess"}).accepted);
}

TEST_F(ValidatorTest, DenylistToleratesAnyWhitespaceRun) {
    EXPECT_EQ(check("git", {"rm  -rf /"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("git", {"rm\t-rf /"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("git", {"rm \t -r  -f /"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("python3", {"-c", "eval\t(x)"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("python3", {"-c", "exec  (x)"}).kind, ErrorKind::DANGEROUS_PATTERN);
    EXPECT_EQ(check("python3", {"-c", ":( ) {"}).kind, ErrorKind::DANGEROUS_PATTERN);

    ValidationOutcome v = check("git", {"rm\t\t-rf /"});
    EXPECT_EQ(v.reason, "Dangerous pattern in argument 0: rm -rf");

    // Still needs at least one separator between "rm" and the flag
    EXPECT_TRUE(check("git", {"form-rf"}).accepted);
    EXPECT_TRUE(check("git", {"RM\t-RF"}).accepted);
}

TEST(DangerousPatternTest, LongWhitespaceRunsAreMatchedWithoutRecursion) {
    std::string arg = "rm" + std::string(200000, ' ') + "-rf";
    EXPECT_EQ(CommandValidator::match_dangerous_pattern(arg), "rm -rf");
    EXPECT_EQ(CommandValidator::match_dangerous_pattern(std::string(200000, 'a')), "");
    EXPECT_EQ(CommandValidator::match_dangerous_pattern("status --short"), "");
}

TEST_F(ValidatorTest, RejectsParentDirectoryComponents) {
    const char* bad[] = {
        "..", "../etc", "a/../b", "a/..", "..\\windows", "--path=..", "x:..:y",
    };
    for (size_t i = 0; i < sizeof(bad) / sizeof(bad[0]); ++i) {
        ValidationOutcome v = check("ls", {bad[i]});
        EXPECT_EQ(v.kind, ErrorKind::PATH_TRAVERSAL) << bad[i];
        EXPECT_EQ(v.reason, "Potential path traversal in argument 0");
    }
}

TEST_F(ValidatorTest, DotsInsideNamesAreNotTraversal) {
    EXPECT_TRUE(check("ls", {"file..txt"}).accepted);
    EXPECT_TRUE(check("ls", {"..."}).accepted);
    EXPECT_TRUE(check("ls", {"..hidden"}).accepted);
    EXPECT_TRUE(check("git", {"HEAD~1..HEAD"}).accepted);
    EXPECT_TRUE(check("ls", {"."}).accepted);
}

TEST_F(ValidatorTest, ChecksRunInFixedOrder) {
    // Not whitelisted wins over everything
    std::vector<std::string> many(10, "a;b");
    EXPECT_EQ(check("rm", many).kind, ErrorKind::NOT_WHITELISTED);

    // Count before length and characters
    std::vector<std::string> long_many(6, std::string(40, ';'));
    EXPECT_EQ(check("ls", long_many).kind, ErrorKind::TOO_MANY_ARGUMENTS);

    // Length before characters, across all arguments
    EXPECT_EQ(check("ls", {"a;b", std::string(40, 'x')}).kind, ErrorKind::ARGUMENT_TOO_LONG);

    // Characters before patterns and traversal
    EXPECT_EQ(check("ls", {"../x", "rm -rf", "a|b"}).kind, ErrorKind::DANGEROUS_CHARACTER);

    // Patterns before traversal
    EXPECT_EQ(check("ls", {"../x", "rm -rf"}).kind, ErrorKind::DANGEROUS_PATTERN);
}

TEST_F(ValidatorTest, ValidationIsDeterministic) {
    CommandRequest good("git", {"status"});
    CommandRequest bad("ls", {"a`b`"});

    EXPECT_EQ(CommandValidator::validate(good, policy_), CommandValidator::validate(good, policy_));
    EXPECT_EQ(CommandValidator::validate(bad, policy_), CommandValidator::validate(bad, policy_));
}

TEST_F(ValidatorTest, DoesNotSanitizeOnItsOwn) {
    // Trailing newline is only removed by the sanitizer stage
    EXPECT_EQ(check("ls", {"x\n"}).kind, ErrorKind::DANGEROUS_CHARACTER);
}

TEST_F(ValidatorTest, CarriesRequestOptionsThrough) {
    CommandRequest req("ls", {"-l"});
    req.working_dir = std::string("/tmp");
    req.timeout_seconds = 7;
    ValidationOutcome v = CommandValidator::validate(req, policy_);
    ASSERT_TRUE(v.accepted);
    EXPECT_EQ(v.request, req);
}
