// =============================================================================
// Anchor Explain - Validity Check Tests
// =============================================================================

#include "anchor_explain/search/validity_checker.h"

#include "test_doubles.h"

#include <cmath>

#include <gtest/gtest.h>

namespace anchor {
namespace search {
namespace {

ValidityConfig makeConfig(double tau, size_t feature_count) {
    ValidityConfig config;
    config.tau = tau;
    config.feature_count = feature_count;
    return config;
}

// =============================================================================
// Pure helpers
// =============================================================================

TEST(ValidityHelpersTest, BetaCorrectsForTestedHypotheses) {
    EXPECT_NEAR(ValidityChecker::computeBeta(0.1, 2, 3), std::log(1.0 / (0.1 / 4.0)), 1e-12);
    EXPECT_NEAR(ValidityChecker::computeBeta(0.1, 1, 10), std::log(10.0), 1e-12);
    // Beam width 0 would give fewer than one test
    EXPECT_NEAR(ValidityChecker::computeBeta(0.1, 0, 10), std::log(10.0), 1e-12);
}

TEST(ValidityHelpersTest, NoSamplesGiveTrivialBounds) {
    auto bounds = ValidityChecker::computeBounds(0.0, 0, 3.0);
    EXPECT_DOUBLE_EQ(bounds.lower, 0.0);
    EXPECT_DOUBLE_EQ(bounds.upper, 1.0);
}

TEST(ValidityHelpersTest, BoundTestIsDeterministic) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_TRUE(ValidityChecker::isValid(1.0, 1000, 3.0, 0.95, 0.05));
        EXPECT_FALSE(ValidityChecker::isValid(0.5, 1000, 3.0, 0.95, 0.05));
    }
}

TEST(ValidityHelpersTest, UndecidedWhileBoundsStraddleTau) {
    double beta = ValidityChecker::computeBeta(0.1, 2, 3);
    EXPECT_TRUE(ValidityChecker::isUndecided(ValidityChecker::computeBounds(1.0, 2, beta), 0.95,
                                             0.05));
    EXPECT_FALSE(ValidityChecker::isUndecided(ValidityChecker::computeBounds(1.0, 5000, beta),
                                              0.95, 0.05));
    EXPECT_FALSE(ValidityChecker::isUndecided(ValidityChecker::computeBounds(0.2, 5000, beta),
                                              0.95, 0.05));
}

// =============================================================================
// Sampling loop
// =============================================================================

class ValidityCheckerTest : public ::testing::Test {
  protected:
    CandidatePool pool_;
};

TEST_F(ValidityCheckerTest, PerfectCandidateIsConfirmed) {
    sampling::SamplingService service(test::scriptedSampler({}, 1.0));
    auto* candidate = pool_.create({0});
    candidate->registerSamples(1, 1);

    ValidityChecker checker(makeConfig(0.95, 3));
    auto decision = checker.check(*candidate, service);
    ASSERT_TRUE(decision) << decision.error().toString();
    EXPECT_TRUE(decision->valid);
    EXPECT_FALSE(decision->cap_exhausted);
    EXPECT_GT(decision->extra_rounds, 0u);
    EXPECT_GT(decision->bounds.lower, 0.9);
    EXPECT_EQ(candidate->sampledSize(), 1u + decision->extra_rounds);
}

TEST_F(ValidityCheckerTest, PoorCandidateIsRejected) {
    sampling::SamplingService service(test::scriptedSampler({}, 0.3));
    auto* candidate = pool_.create({0});

    ValidityChecker checker(makeConfig(0.95, 3));
    auto decision = checker.check(*candidate, service);
    ASSERT_TRUE(decision);
    EXPECT_FALSE(decision->valid);
    EXPECT_FALSE(decision->cap_exhausted);
    EXPECT_LT(decision->bounds.upper, 1.0);
}

TEST_F(ValidityCheckerTest, AlreadyDecidedCandidateIsNotSampled) {
    sampling::SamplingService service(test::scriptedSampler({}, 1.0));
    auto* candidate = pool_.create({0});
    candidate->registerSamples(10000, 10000);

    ValidityChecker checker(makeConfig(0.95, 3));
    auto decision = checker.check(*candidate, service);
    ASSERT_TRUE(decision);
    EXPECT_TRUE(decision->valid);
    EXPECT_EQ(decision->extra_rounds, 0u);
    EXPECT_EQ(candidate->sampledSize(), 10000u);
}

TEST_F(ValidityCheckerTest, CapExhaustionCountsAsInvalid) {
    // Precision right at tau keeps the bounds straddling it
    sampling::SamplingService service(test::scriptedSampler({}, 0.95));
    auto* candidate = pool_.create({0});

    ValidityConfig config = makeConfig(0.95, 3);
    config.tau_discrepancy = 0.0;
    config.max_validation_rounds = 25;
    ValidityChecker checker(config);

    auto decision = checker.check(*candidate, service);
    ASSERT_TRUE(decision);
    EXPECT_FALSE(decision->valid);
    EXPECT_TRUE(decision->cap_exhausted);
    EXPECT_EQ(decision->extra_rounds, 25u);
}

TEST_F(ValidityCheckerTest, BatchSizeFollowsInitSampleCount) {
    sampling::SamplingService service(test::scriptedSampler({}, 1.0));
    auto* candidate = pool_.create({0});

    ValidityConfig config = makeConfig(0.95, 3);
    config.init_sample_count = 20;
    ValidityChecker checker(config);

    auto decision = checker.check(*candidate, service);
    ASSERT_TRUE(decision);
    EXPECT_TRUE(decision->valid);
    EXPECT_EQ(candidate->sampledSize(), 20u * decision->extra_rounds);
}

TEST_F(ValidityCheckerTest, SamplingErrorsPropagate) {
    sampling::SamplingService service([](AnchorCandidate&, size_t) -> Result<double> {
        return Error::make(ErrorCode::kSamplingFailed, "offline");
    });
    auto* candidate = pool_.create({0});

    ValidityChecker checker(makeConfig(0.95, 3));
    auto decision = checker.check(*candidate, service);
    ASSERT_FALSE(decision);
    EXPECT_EQ(decision.error().code(), ErrorCode::kSamplingFailed);
}

}  // namespace
}  // namespace search
}  // namespace anchor
