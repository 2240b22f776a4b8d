// =============================================================================
// Anchor Explain - Sampling Service Tests
// =============================================================================

#include "anchor_explain/sampling/sampling_service.h"

#include "test_doubles.h"

#include <algorithm>
#include <atomic>
#include <memory>
#include <stdexcept>
#include <vector>

#include <gtest/gtest.h>

namespace anchor {
namespace sampling {
namespace {

// Counts every sample as positive and records the batch sizes it saw
class CountingSampler {
  public:
    Result<double> operator()(AnchorCandidate& candidate, size_t count) {
        batches->fetch_add(1);
        candidate.registerSamples(count, count);
        return 1.0;
    }

    std::shared_ptr<std::atomic<size_t>> batches = std::make_shared<std::atomic<size_t>>(0);
};

class SamplingServiceTest : public ::testing::TestWithParam<size_t> {
  protected:
    SamplingConfig config(bool balanced = false) const {
        SamplingConfig c;
        c.thread_count = GetParam();
        c.balance_sampling = balanced;
        return c;
    }

    CandidatePool pool_;
};

TEST_P(SamplingServiceTest, SessionMergesEveryRequest) {
    SamplingService service(test::scriptedSampler({}, 0.5), config());
    auto* a = pool_.create({0});
    auto* b = pool_.create({1});

    auto session = service.createSession();
    session.registerCandidateEvaluation(a, 10).registerCandidateEvaluation(b, 20);
    ASSERT_TRUE(session.run());

    EXPECT_EQ(a->sampledSize(), 10u);
    EXPECT_EQ(b->sampledSize(), 20u);
    EXPECT_EQ(a->positiveSamples(), 5u);
    EXPECT_EQ(b->positiveSamples(), 10u);
    EXPECT_EQ(service.stats().samples_drawn, 30u);
    EXPECT_EQ(service.stats().sessions_run, 1u);
}

TEST_P(SamplingServiceTest, RequestsForTheSameCandidateAreMerged) {
    SamplingService service(test::scriptedSampler({}, 1.0), config());
    auto* a = pool_.create({0});

    auto session = service.createSession();
    session.registerCandidateEvaluation(a, 5);
    session.registerCandidateEvaluation(a, 7);
    session.registerCandidateEvaluation(a, 0);
    EXPECT_EQ(session.pendingRequests(), 1u);

    ASSERT_TRUE(session.run());
    EXPECT_EQ(a->sampledSize(), 12u);
}

TEST_P(SamplingServiceTest, FinishedSessionDoesNotSampleAgain) {
    SamplingService service(test::scriptedSampler({}, 1.0), config());
    auto* a = pool_.create({0});

    auto session = service.createSession();
    session.registerCandidateEvaluation(a, 4);
    ASSERT_TRUE(session.run());
    EXPECT_TRUE(session.finished());
    ASSERT_TRUE(session.run());

    EXPECT_EQ(a->sampledSize(), 4u);
}

TEST_P(SamplingServiceTest, EmptySessionSucceeds) {
    SamplingService service(test::scriptedSampler({}, 1.0), config());
    auto session = service.createSession();
    EXPECT_TRUE(session.run());
    EXPECT_EQ(service.stats().sessions_run, 0u);
}

TEST_P(SamplingServiceTest, FailingSamplerAbortsSession) {
    SamplingService service(
        [](AnchorCandidate&, size_t) -> Result<double> {
            return Error::make(ErrorCode::kSamplingFailed, "classifier unavailable");
        },
        config());
    auto* a = pool_.create({0});

    auto session = service.createSession();
    session.registerCandidateEvaluation(a, 3);
    auto result = session.run();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::kSamplingFailed);
    EXPECT_FALSE(a->isBeingSampled());
}

TEST_P(SamplingServiceTest, ThrowingSamplerBecomesSamplingError) {
    SamplingService service(
        [](AnchorCandidate&, size_t) -> Result<double> { throw std::runtime_error("bad row"); },
        config());
    auto* a = pool_.create({0});

    auto session = service.createSession();
    session.registerCandidateEvaluation(a, 3);
    auto result = session.run();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::kSamplingFailed);
    EXPECT_FALSE(a->isBeingSampled());
}

TEST_P(SamplingServiceTest, NonStandardThrowFailsSessionAndReleasesClaims) {
    SamplingService service(
        [](AnchorCandidate& candidate, size_t count) -> Result<double> {
            if (candidate.canonicalFeatures() == FeatureSet{1}) {
                throw 42;
            }
            candidate.registerSamples(count, count);
            return 1.0;
        },
        config());
    auto* a = pool_.create({0});
    auto* b = pool_.create({1});

    auto session = service.createSession();
    session.registerCandidateEvaluation(a, 10).registerCandidateEvaluation(b, 10);
    auto result = session.run();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::kSamplingFailed);
    EXPECT_EQ(b->sampledSize(), 0u);
    EXPECT_FALSE(a->isBeingSampled());
    EXPECT_FALSE(b->isBeingSampled());

    // Neither candidate stays claimed by the failed session
    auto retry = service.createSession();
    retry.registerCandidateEvaluation(a, 5);
    ASSERT_TRUE(retry.run());
    EXPECT_GE(a->sampledSize(), 5u);
}

TEST_P(SamplingServiceTest, CandidateClaimedElsewhereIsConflict) {
    SamplingService service(test::scriptedSampler({}, 1.0), config());
    auto* a = pool_.create({0});
    auto* b = pool_.create({1});
    ASSERT_TRUE(a->acquireSampling());

    auto session = service.createSession();
    session.registerCandidateEvaluation(b, 2).registerCandidateEvaluation(a, 2);
    auto result = session.run();

    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::kSessionConflict);
    EXPECT_EQ(b->sampledSize(), 0u);
    EXPECT_FALSE(b->isBeingSampled());
    a->releaseSampling();
}

TEST_P(SamplingServiceTest, BalancedSamplingSplitsRequests) {
    CountingSampler sampler;
    auto batches = sampler.batches;
    SamplingService service(sampler, config(true));
    auto* a = pool_.create({0});

    auto session = service.createSession();
    session.registerCandidateEvaluation(a, 10);
    ASSERT_TRUE(session.run());

    EXPECT_EQ(a->sampledSize(), 10u);
    EXPECT_EQ(a->positiveSamples(), 10u);
    const size_t threads = GetParam();
    if (threads > 1) {
        EXPECT_EQ(batches->load(), std::min<size_t>(threads, 10));
    } else {
        EXPECT_EQ(batches->load(), 1u);
    }
}

INSTANTIATE_TEST_SUITE_P(ThreadCounts, SamplingServiceTest, ::testing::Values(1, 4));

TEST(SamplingServiceEvaluateTest, ZeroSamplesSkipTheSampler) {
    bool called = false;
    SamplingService service([&called](AnchorCandidate&, size_t) -> Result<double> {
        called = true;
        return 1.0;
    });
    AnchorCandidate candidate(1, {0});

    auto result = service.evaluate(candidate, 0);
    ASSERT_TRUE(result);
    EXPECT_DOUBLE_EQ(*result, 0.0);
    EXPECT_FALSE(called);
}

TEST(SamplingServiceEvaluateTest, ManySessionsOnAPool) {
    SamplingConfig config;
    config.thread_count = 3;
    SamplingService service(test::scriptedSampler({}, 1.0), config);
    CandidatePool pool;
    std::vector<AnchorCandidate*> candidates;
    for (FeatureIndex f = 0; f < 8; ++f) {
        candidates.push_back(pool.create({f}));
    }

    for (int round = 0; round < 10; ++round) {
        auto session = service.createSession();
        for (auto* c : candidates) {
            session.registerCandidateEvaluation(c, 5);
        }
        ASSERT_TRUE(session.run());
    }

    for (auto* c : candidates) {
        EXPECT_EQ(c->sampledSize(), 50u);
        EXPECT_DOUBLE_EQ(c->precision(), 1.0);
    }
    EXPECT_EQ(service.stats().sessions_run, 10u);
}

}  // namespace
}  // namespace sampling
}  // namespace anchor
