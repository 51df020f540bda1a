/**
 * @file test_cache_key.cpp
 * @brief Unit tests for content-addressed cache keys
 */

#include <prism/cache/CacheKey.hpp>

#include <gtest/gtest.h>

#include <cctype>
#include <string>
#include <vector>

using namespace prism;

TEST(CacheKey, Fnv1aKnownVectors) {
    EXPECT_EQ(Fnv1a64(""), 0xcbf29ce484222325ULL);
    EXPECT_EQ(Fnv1a64("a"), 0xaf63dc4c8601ec8cULL);
}

TEST(CacheKey, DeterministicAcrossCalls) {
    auto p = EvaluationParams::FromJSON({{"threshold", "soft"}, {"beta", 30}, {"mode", "physics"}});
    EXPECT_EQ(DeriveKey("cascade", p), DeriveKey("cascade", p));
}

TEST(CacheKey, Shape) {
    auto key = DeriveKey("cascade", EvaluationParams(), "prism:");
    ASSERT_EQ(key.size(), std::string("prism:").size() + 16);
    EXPECT_EQ(key.rfind("prism:", 0), 0u);
    for (char c : key.substr(6)) {
        EXPECT_TRUE(std::isxdigit(static_cast<unsigned char>(c))) << key;
    }
}

TEST(CacheKey, ExtraOrderDoesNotMatter) {
    auto a = EvaluationParams::FromJSON({{"extra", {"--x=1", "--y=2"}}});
    auto b = EvaluationParams::FromJSON({{"extra", {"--y=2", "--x=1"}}});
    EXPECT_EQ(DeriveKey("cascade", a), DeriveKey("cascade", b));
}

TEST(CacheKey, RepeatedFlagLastValueWins) {
    auto x1_then_x2 = EvaluationParams::FromJSON({{"extra", {"--x=1", "--x=2"}}});
    auto x2_then_x1 = EvaluationParams::FromJSON({{"extra", {"--x=2", "--x=1"}}});
    auto only_x2 = EvaluationParams::FromJSON({{"extra", {"--x=2"}}});
    EXPECT_NE(DeriveKey("cascade", x1_then_x2), DeriveKey("cascade", x2_then_x1));
    EXPECT_EQ(DeriveKey("cascade", x1_then_x2), DeriveKey("cascade", only_x2));
}

TEST(CacheKey, CanonicalExtra) {
    EXPECT_EQ(CanonicalExtra({"--y=2", "--v", "--x=1", "--y=3", "--v"}),
              (std::vector<std::string>{"--v", "--v", "--x=1", "--y=3"}));
}

TEST(CacheKey, EveryOutputFieldChangesTheKey) {
    const auto base = DeriveKey("cascade", EvaluationParams());
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"threshold", "hard"}})));
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"beta", 31}})));
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"mode", "linear"}})));
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"n2", 2e-17}})));
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"a_eff", 1e-12}})));
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"n_eff", 2.0}})));
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"g_geom", 0.7}})));
    EXPECT_NE(base, DeriveKey("cascade", EvaluationParams::FromJSON({{"extra", {"--v"}}})));
}

TEST(CacheKey, OperationIsPartOfIdentity) {
    EXPECT_NE(DeriveKey("cascade", EvaluationParams()), DeriveKey("characterize", EvaluationParams()));
}

TEST(CacheKey, PrefixApplied) {
    auto key = DeriveKey("cascade", EvaluationParams(), "lab7:");
    EXPECT_EQ(key.rfind("lab7:", 0), 0u);
}
