/**
 * @file test_sanitizer.cpp
 * @brief Unit tests for the extra-flag allow-list
 */

#include <prism/exec/ArgumentSanitizer.hpp>

#include <gtest/gtest.h>

using namespace prism;

TEST(ArgumentSanitizer, AcceptsFlagShapes) {
    EXPECT_TRUE(ArgumentSanitizer::IsAllowed("--verbose"));
    EXPECT_TRUE(ArgumentSanitizer::IsAllowed("--beta=30.5"));
    EXPECT_TRUE(ArgumentSanitizer::IsAllowed("--n2=1e-17"));
    EXPECT_TRUE(ArgumentSanitizer::IsAllowed("--xpm-mode=physics"));
    EXPECT_TRUE(ArgumentSanitizer::IsAllowed("--report=power_mw"));
}

TEST(ArgumentSanitizer, RejectsShellAndPositional) {
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("; rm -rf /"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("--out=$(whoami)"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("--out=a b"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("--path=/etc/passwd"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("-v"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("cascade"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("--Upper"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed("--"));
    EXPECT_FALSE(ArgumentSanitizer::IsAllowed(""));
}

TEST(ArgumentSanitizer, SanitizeKeepsOrderAndDropsRejected) {
    std::vector<std::string> in = {"--a=1", "|cat", "--b", "&&", "--c=x.y"};
    std::vector<std::string> expected = {"--a=1", "--b", "--c=x.y"};
    EXPECT_EQ(ArgumentSanitizer::Sanitize(in), expected);
}

TEST(ArgumentSanitizer, SanitizeEmpty) {
    EXPECT_TRUE(ArgumentSanitizer::Sanitize({}).empty());
}
