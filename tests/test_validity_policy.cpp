#include <gtest/gtest.h>
#include <limits>
#include "../src/CacheValidityPolicy.hpp"
#include "TestHelpers.hpp"

class CacheValidityPolicyTest : public ::testing::Test {
protected:
    CacheConfig config;
    CacheValidityPolicy policy{config};
};

TEST_F(CacheValidityPolicyTest, AgeIsResidentTimeWithoutDateOrAge) {
    CacheEntry entry = makeEntry({});
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0), 0);
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0 + 10), 10);
}

TEST_F(CacheValidityPolicyTest, ApparentAgeComesFromDateHeader) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0 - 5)}});
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0), 5);
}

TEST_F(CacheValidityPolicyTest, CorrectedAgeAddsResponseDelayToAgeHeader) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0)}, {"Age", "30"}}, "", T0 - 2, T0);
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0), 32);
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0 + 8), 40);
}

TEST_F(CacheValidityPolicyTest, ApparentAgeWinsWhenLarger) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0 - 100)}, {"Age", "10"}});
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0), 100);
}

TEST_F(CacheValidityPolicyTest, DateInTheFutureDoesNotMakeAgeNegative) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0 + 500)}});
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0), 0);
}

TEST_F(CacheValidityPolicyTest, AgeClampsToZeroWhenNowPrecedesResponse) {
    CacheEntry entry = makeEntry({});
    for (time_t before : {1, 10, 3600, 86400}) {
        EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0 - before), 0) << before << "s before the response";
    }
}

TEST_F(CacheValidityPolicyTest, AgeGrowsExactlyWithElapsedTime) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0 - 3)}, {"Age", "7"}}, "", T0 - 1, T0);
    const time_t start = T0 + 5;
    long ageAtStart = policy.getCurrentAgeSecs(entry, start);
    for (long k : {1L, 17L, 3600L}) {
        EXPECT_EQ(policy.getCurrentAgeSecs(entry, start + k) - ageAtStart, k);
    }
}

TEST_F(CacheValidityPolicyTest, LargestAgeHeaderWins) {
    CacheEntry entry = makeEntry({{"Age", "5"}, {"Age", "20"}});
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0), 20);
}

TEST_F(CacheValidityPolicyTest, MalformedAgeHeaderMakesEntryLookOld) {
    EXPECT_GE(policy.getCurrentAgeSecs(makeEntry({{"Age", "soon"}}), T0), CacheValidityPolicy::MAX_AGE);
    EXPECT_GE(policy.getCurrentAgeSecs(makeEntry({{"Age", "-4"}}), T0), CacheValidityPolicy::MAX_AGE);
}

TEST_F(CacheValidityPolicyTest, UnparseableDateCountsAsAbsent) {
    CacheEntry entry = makeEntry({{"Date", "not a date"}});
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, T0 + 3), 3);
}

TEST_F(CacheValidityPolicyTest, MaxAgeFreshness) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0)}, {"Cache-Control", "max-age=100"}});
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(entry), 100);
    EXPECT_TRUE(policy.isResponseFresh(entry, T0 + 50));
    EXPECT_FALSE(policy.isResponseFresh(entry, T0 + 100));
    EXPECT_FALSE(policy.isResponseFresh(entry, T0 + 150));
}

TEST_F(CacheValidityPolicyTest, SMaxAgeOnlyCountsInSharedCache) {
    CacheEntry entry = makeEntry({{"Cache-Control", "max-age=100, s-maxage=10"}});
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(entry), 10);

    CacheConfig privateConfig;
    privateConfig.setSharedCache(false);
    CacheValidityPolicy privatePolicy(privateConfig);
    EXPECT_EQ(privatePolicy.getFreshnessLifetimeSecs(entry), 100);
}

TEST_F(CacheValidityPolicyTest, SmallestMaxAgeAcrossHeaderLinesWins) {
    CacheEntry entry = makeEntry({{"Cache-Control", "max-age=100"}, {"Cache-Control", "max-age=30"}});
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(entry), 30);
}

TEST_F(CacheValidityPolicyTest, MalformedMaxAgeGivesNoFreshness) {
    CacheEntry entry = makeEntry({
        {"Date", httpDate(T0)},
        {"Expires", httpDate(T0 + 300)},
        {"Cache-Control", "max-age=abc"}
    });
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(entry), 0);
}

TEST_F(CacheValidityPolicyTest, ExpiresMinusDate) {
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(makeEntry({{"Date", httpDate(T0)}, {"Expires", httpDate(T0 + 300)}})), 300);
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(makeEntry({{"Date", httpDate(T0)}, {"Expires", httpDate(T0 - 300)}})), 0);
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(makeEntry({{"Expires", httpDate(T0 + 300)}})), 0);
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(makeEntry({{"Date", httpDate(T0)}, {"Expires", "0"}})), 0);
}

TEST_F(CacheValidityPolicyTest, MaxAgeTakesPrecedenceOverExpires) {
    CacheEntry entry = makeEntry({
        {"Date", httpDate(T0)},
        {"Expires", httpDate(T0 + 300)},
        {"Cache-Control", "max-age=10"}
    });
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(entry), 10);
}

TEST_F(CacheValidityPolicyTest, NoExplicitFreshnessMeansZero) {
    EXPECT_EQ(policy.getFreshnessLifetimeSecs(makeEntry({{"Date", httpDate(T0)}})), 0);
    EXPECT_FALSE(policy.isResponseFresh(makeEntry({{"Date", httpDate(T0)}}), T0));
}

TEST_F(CacheValidityPolicyTest, HeuristicLifetimeIsFractionOfTimeSinceModification) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0)}, {"Last-Modified", httpDate(T0 - 1000)}});
    EXPECT_EQ(policy.getHeuristicFreshnessLifetimeSecs(entry, 0.1f, 42), 100);
    EXPECT_TRUE(policy.isResponseHeuristicallyFresh(entry, T0 + 50, 0.1f, 42));
    EXPECT_FALSE(policy.isResponseHeuristicallyFresh(entry, T0 + 150, 0.1f, 42));
}

TEST_F(CacheValidityPolicyTest, HeuristicLifetimeFallsBackToDefault) {
    EXPECT_EQ(policy.getHeuristicFreshnessLifetimeSecs(makeEntry({{"Date", httpDate(T0)}}), 0.1f, 42), 42);
    EXPECT_EQ(policy.getHeuristicFreshnessLifetimeSecs(
                  makeEntry({{"Date", httpDate(T0)}, {"Last-Modified", "whenever"}}), 0.1f, 42), 42);
}

TEST_F(CacheValidityPolicyTest, HeuristicLifetimeNeverNegative) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0)}, {"Last-Modified", httpDate(T0 + 1000)}});
    EXPECT_EQ(policy.getHeuristicFreshnessLifetimeSecs(entry, 0.1f, 42), 0);
}

TEST_F(CacheValidityPolicyTest, Staleness) {
    CacheEntry entry = makeEntry({{"Date", httpDate(T0)}, {"Cache-Control", "max-age=100"}});
    EXPECT_EQ(policy.getStalenessSecs(entry, T0 + 50), 0);
    EXPECT_EQ(policy.getStalenessSecs(entry, T0 + 150), 50);
}

TEST_F(CacheValidityPolicyTest, RevalidationDirectives) {
    CacheEntry entry = makeEntry({{"Cache-Control", "max-age=10"}, {"Cache-Control", "Must-Revalidate"}});
    EXPECT_TRUE(policy.mustRevalidate(entry));
    EXPECT_FALSE(policy.proxyRevalidate(entry));
    EXPECT_TRUE(policy.hasCacheControlDirective(entry, "max-age"));
    EXPECT_FALSE(policy.hasCacheControlDirective(entry, "s-maxage"));

    EXPECT_TRUE(policy.proxyRevalidate(makeEntry({{"Cache-Control", "proxy-revalidate"}})));
}

TEST_F(CacheValidityPolicyTest, ContentLengthConsistency) {
    EXPECT_TRUE(policy.contentLengthHeaderMatchesActualLength(makeEntry({}, "hello")));
    EXPECT_TRUE(policy.contentLengthHeaderMatchesActualLength(makeEntry({{"Content-Length", "5"}}, "hello")));
    EXPECT_FALSE(policy.contentLengthHeaderMatchesActualLength(
                     makeEntry({{"Content-Length", "500"}}, std::string(400, 'x'))));
    EXPECT_FALSE(policy.contentLengthHeaderMatchesActualLength(makeEntry({{"Content-Length", "five"}}, "hello")));
}

TEST_F(CacheValidityPolicyTest, HugeAgeHeaderIsCappedAndStale) {
    CacheEntry entry = makeEntry({
        {"Date", httpDate(T0)},
        {"Cache-Control", "max-age=60"},
        {"Age", "9223372036854775807"}
    }, "", T0 - 5, T0);
    EXPECT_GE(policy.getCurrentAgeSecs(entry, T0 + 5), CacheValidityPolicy::MAX_AGE);
    EXPECT_FALSE(policy.isResponseFresh(entry, T0 + 5));
    EXPECT_GT(policy.getStalenessSecs(entry, T0 + 5), 0);
}

TEST_F(CacheValidityPolicyTest, AgeSaturatesInsteadOfWrapping) {
    CacheEntry entry = makeEntry({{"Age", "9223372036854775807"}}, "", 0, T0);
    EXPECT_EQ(policy.getCurrentAgeSecs(entry, std::numeric_limits<time_t>::max()),
              std::numeric_limits<long>::max());
}
