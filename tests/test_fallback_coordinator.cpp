#include <gtest/gtest.h>
#include <future>
#include "fallback_coordinator.hpp"
#include "test_helpers.hpp"

using namespace std::chrono_literals;

class FallbackCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        events = std::make_shared<RecordingEventSink>();
        budget = std::make_unique<BudgetManager>(BudgetConfig{});
        make_coordinator();

        input.request = make_png_request(WorkType::FallProtection);
        input.image = cv::Mat(48, 64, CV_8UC3, cv::Scalar(90, 90, 90));
    }

    void TearDown() override {
        runner.join_all();
    }

    void make_coordinator() {
        coordinator = std::make_unique<FallbackCoordinator>(cfg, runner, *budget, accelerator,
                                                            cloud_gate, &metrics, events);
    }

    AnalysisResult run(const std::vector<Backend>& ordered,
                       DeviceClass device_class = DeviceClass::MidRange) {
        return coordinator->run(ordered, input, device_class, token);
    }

    TaskRunner runner;
    ConcurrencyGate accelerator{1};
    ConcurrencyGate cloud_gate{4};
    MetricsRegistry metrics;
    CoordinatorConfig cfg;
    std::shared_ptr<RecordingEventSink> events;
    std::unique_ptr<BudgetManager> budget;
    std::unique_ptr<FallbackCoordinator> coordinator;
    BackendInput input;
    CancelToken token;
};

TEST_F(FallbackCoordinatorTest, FirstAcceptedResultStopsTheChain) {
    auto later = std::make_shared<std::atomic<int>>(0);
    auto result = run({scripted::local("yolo-large", Tier::LocalLarge, 0.9f),
                       scripted::local("yolo-small", Tier::LocalSmall, 0.9f, later),
                       scripted::emergency()});

    EXPECT_EQ(result.source_backend, "yolo-large");
    EXPECT_EQ(result.source_tier, Tier::LocalLarge);
    EXPECT_FLOAT_EQ(result.overall_confidence, 0.9f);
    EXPECT_EQ(result.request_id, input.request.id);
    ASSERT_EQ(result.provenance.size(), 1u);
    EXPECT_EQ(result.provenance[0].outcome, AttemptOutcome::Accepted);
    EXPECT_EQ(later->load(), 0);
    EXPECT_DOUBLE_EQ(result.total_cost, 0.0);
}

TEST_F(FallbackCoordinatorTest, CloudFailureFallsBackToLocalLarge) {
    auto result = run({scripted::cloud_failing(),
                       scripted::local("yolo-large", Tier::LocalLarge, 0.85f),
                       scripted::local("yolo-small", Tier::LocalSmall, 0.9f),
                       scripted::emergency()});

    ASSERT_EQ(result.provenance.size(), 2u);
    EXPECT_EQ(result.provenance[0].tier, Tier::Cloud);
    EXPECT_EQ(result.provenance[0].outcome, AttemptOutcome::Failed);
    EXPECT_NE(result.provenance[0].error.find("connection reset"), std::string::npos);
    EXPECT_EQ(result.provenance[1].tier, Tier::LocalLarge);
    EXPECT_EQ(result.provenance[1].outcome, AttemptOutcome::Accepted);
    EXPECT_EQ(result.source_tier, Tier::LocalLarge);

    // Failed cloud call is refunded
    auto s = budget->state();
    EXPECT_DOUBLE_EQ(s.daily_spend, 0.0);
    EXPECT_DOUBLE_EQ(s.reserved, 0.0);
    EXPECT_DOUBLE_EQ(result.total_cost, 0.0);
}

TEST_F(FallbackCoordinatorTest, AcceptedCloudCallIsCharged) {
    auto result = run({scripted::cloud(0.9f), scripted::emergency()});

    EXPECT_EQ(result.source_tier, Tier::Cloud);
    EXPECT_DOUBLE_EQ(result.total_cost, 0.05);
    EXPECT_DOUBLE_EQ(budget->state().daily_spend, 0.05);
    EXPECT_DOUBLE_EQ(budget->state().reserved, 0.0);
}

TEST_F(FallbackCoordinatorTest, GracefulDegradationReturnsBestCandidate) {
    auto result = run({scripted::cloud(0.40f),
                       scripted::local("yolo-large", Tier::LocalLarge, 0.55f),
                       scripted::local("yolo-small", Tier::LocalSmall, 0.35f),
                       scripted::emergency()});

    EXPECT_EQ(result.source_backend, "yolo-large");
    EXPECT_FLOAT_EQ(result.overall_confidence, 0.55f);
    ASSERT_EQ(result.provenance.size(), 4u);
    for (const auto& rec : result.provenance) {
        EXPECT_EQ(rec.outcome, AttemptOutcome::LowConfidence) << rec.backend;
    }
    // Low-confidence cloud reply was still paid for
    EXPECT_DOUBLE_EQ(result.total_cost, 0.05);
}

TEST_F(FallbackCoordinatorTest, AllFailedCarriesProvenance) {
    try {
        run({scripted::cloud_failing(),
             scripted::local_failing("yolo-large", Tier::LocalLarge),
             scripted::local_failing("yolo-small", Tier::LocalSmall)});
        FAIL() << "expected AllBackendsFailed";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.code(), ErrorCode::AllBackendsFailed);
        ASSERT_EQ(e.provenance().size(), 3u);
        EXPECT_EQ(e.provenance()[0].tier, Tier::Cloud);
        EXPECT_EQ(e.provenance()[1].tier, Tier::LocalLarge);
        EXPECT_EQ(e.provenance()[2].tier, Tier::LocalSmall);
    }
}

TEST_F(FallbackCoordinatorTest, EmergencyAnswersWhenEverythingElseFails) {
    auto result = run({scripted::local_failing("yolo-large", Tier::LocalLarge),
                       scripted::emergency()});

    EXPECT_EQ(result.source_tier, Tier::Emergency);
    ASSERT_FALSE(result.hazards.empty());
    EXPECT_EQ(result.hazards.back().type, HazardType::ManualReview);
}

TEST_F(FallbackCoordinatorTest, SlowBackendTimesOut) {
    cfg.timeouts[Tier::LocalLarge] = 50ms;
    make_coordinator();

    auto result = run({scripted::local_hanging("yolo-large", Tier::LocalLarge),
                       scripted::local("yolo-small", Tier::LocalSmall, 0.9f)});

    ASSERT_EQ(result.provenance.size(), 2u);
    EXPECT_EQ(result.provenance[0].outcome, AttemptOutcome::TimedOut);
    EXPECT_NE(result.provenance[0].error.find("50ms"), std::string::npos);
    EXPECT_GE(result.provenance[0].latency_ms, 50.0);
    EXPECT_EQ(result.source_backend, "yolo-small");
}

TEST_F(FallbackCoordinatorTest, TimedOutCloudCallIsRefunded) {
    cfg.timeouts[Tier::Cloud] = 40ms;
    make_coordinator();

    auto result = run({scripted::cloud_hanging(), scripted::emergency()});
    EXPECT_EQ(result.provenance[0].outcome, AttemptOutcome::TimedOut);
    EXPECT_DOUBLE_EQ(budget->state().reserved, 0.0);
    EXPECT_DOUBLE_EQ(budget->state().daily_spend, 0.0);
}

TEST_F(FallbackCoordinatorTest, CancellationStopsTheChainAndRefunds) {
    std::thread canceller([this] {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });
    try {
        run({scripted::cloud_hanging(), scripted::emergency()});
        FAIL() << "expected Cancelled";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.code(), ErrorCode::Cancelled);
        ASSERT_EQ(e.provenance().size(), 1u);
        EXPECT_EQ(e.provenance()[0].error, "cancelled");
    }
    canceller.join();
    EXPECT_DOUBLE_EQ(budget->state().reserved, 0.0);
}

TEST_F(FallbackCoordinatorTest, BudgetRaceSkipsCloudWithoutRecord) {
    budget = std::make_unique<BudgetManager>(BudgetConfig{0.0, 0.0});
    make_coordinator();
    auto calls = std::make_shared<std::atomic<int>>(0);

    auto result = run({scripted::cloud(0.9f, calls),
                       scripted::local("yolo-large", Tier::LocalLarge, 0.9f)});
    EXPECT_EQ(calls->load(), 0);
    ASSERT_EQ(result.provenance.size(), 1u);
    EXPECT_EQ(result.provenance[0].tier, Tier::LocalLarge);
}

TEST_F(FallbackCoordinatorTest, TokenPricedCloudSpendIsEnforced) {
    // Reservation bound: (1024 + 2048) tokens at $0.01/1k = $0.03072; each call uses 1500 tokens
    budget = std::make_unique<BudgetManager>(BudgetConfig{0.05, 100.0});
    make_coordinator();
    auto calls = std::make_shared<std::atomic<int>>(0);
    std::vector<Backend> chain = {scripted::cloud_metered(0.9f, 1500, 0.01, calls),
                                  scripted::local("yolo-large", Tier::LocalLarge, 0.9f)};

    auto first = run(chain);
    EXPECT_EQ(first.source_tier, Tier::Cloud);
    EXPECT_NEAR(first.total_cost, 0.015, 1e-9);
    EXPECT_NEAR(budget->state().daily_spend, 0.015, 1e-9);

    auto second = run(chain);
    EXPECT_EQ(second.source_tier, Tier::Cloud);
    EXPECT_NEAR(budget->state().daily_spend, 0.03, 1e-9);

    // $0.02 left cannot cover the bound, so cloud is skipped without a record
    auto third = run(chain);
    EXPECT_EQ(third.source_tier, Tier::LocalLarge);
    ASSERT_EQ(third.provenance.size(), 1u);
    EXPECT_EQ(third.provenance[0].tier, Tier::LocalLarge);
    EXPECT_EQ(calls->load(), 2);
    EXPECT_NEAR(budget->state().daily_spend, 0.03, 1e-9);
    EXPECT_FALSE(budget->state().can_afford(chain[0].descriptor().cost_per_call));
}

TEST_F(FallbackCoordinatorTest, PerWorkTypeThreshold) {
    cfg.thresholds[WorkType::FallProtection] = 0.8f;
    make_coordinator();

    auto strict = run({scripted::local("yolo-large", Tier::LocalLarge, 0.7f)});
    EXPECT_EQ(strict.provenance[0].outcome, AttemptOutcome::LowConfidence);

    input.request = make_png_request(WorkType::Painting);
    auto relaxed = run({scripted::local("yolo-large", Tier::LocalLarge, 0.7f)});
    EXPECT_EQ(relaxed.provenance[0].outcome, AttemptOutcome::Accepted);
}

TEST_F(FallbackCoordinatorTest, LocalTiersShareTheAccelerator) {
    auto active = std::make_shared<std::atomic<int>>(0);
    auto peak = std::make_shared<std::atomic<int>>(0);
    auto tracked = Backend(LocalBackend(
        scripted::local_config("yolo-large", Tier::LocalLarge),
        [active, peak](const cv::Mat&, const CancelToken&) {
            int now = active->fetch_add(1) + 1;
            int prev = peak->load();
            while (now > prev && !peak->compare_exchange_weak(prev, now)) {
            }
            std::this_thread::sleep_for(20ms);
            active->fetch_sub(1);
            Detection d;
            d.label = "ladder";
            d.bbox = cv::Rect(0, 0, 8, 8);
            d.confidence = 0.9f;
            return std::vector<Detection>{d};
        }));

    std::vector<std::future<AnalysisResult>> runs;
    for (int i = 0; i < 4; ++i) {
        runs.push_back(std::async(std::launch::async, [this, tracked] {
            return coordinator->run({tracked}, input, DeviceClass::MidRange, CancelToken());
        }));
    }
    for (auto& f : runs) EXPECT_EQ(f.get().source_backend, "yolo-large");
    EXPECT_EQ(peak->load(), 1);
}

TEST_F(FallbackCoordinatorTest, AttemptsAreObservable) {
    run({scripted::cloud_failing(), scripted::local("yolo-large", Tier::LocalLarge, 0.9f)});

    EXPECT_EQ(events->count(EventKind::AttemptStarted), 2u);
    EXPECT_EQ(events->count(EventKind::AttemptFinished), 2u);
    auto snapshot = metrics.snapshot();
    EXPECT_EQ(snapshot.tiers[tier_index(Tier::Cloud)].failures, 1u);
    EXPECT_EQ(snapshot.tiers[tier_index(Tier::LocalLarge)].successes, 1u);
}

TEST(CoordinatorConfigTest, TimeoutScalesWithDeviceClass) {
    CoordinatorConfig cfg;
    EXPECT_EQ(cfg.timeout_for(Tier::Cloud, DeviceClass::MidRange), 15000ms);
    EXPECT_EQ(cfg.timeout_for(Tier::LocalLarge, DeviceClass::LowEnd), 15000ms);
    EXPECT_EQ(cfg.timeout_for(Tier::LocalSmall, DeviceClass::HighEnd), 6400ms);
    EXPECT_EQ(cfg.timeout_for(Tier::Emergency, DeviceClass::MidRange), 2000ms);
}

TEST(CoordinatorConfigTest, ThresholdOverride) {
    CoordinatorConfig cfg;
    cfg.thresholds[WorkType::Electrical] = 0.75f;
    EXPECT_FLOAT_EQ(cfg.threshold_for(WorkType::Electrical), 0.75f);
    EXPECT_FLOAT_EQ(cfg.threshold_for(WorkType::Plumbing), 0.6f);
}

struct ThresholdParams {
    float confidence;
    float threshold;
    bool accepted;
};

class ThresholdSweepTest : public FallbackCoordinatorTest,
                           public ::testing::WithParamInterface<ThresholdParams> {};

TEST_P(ThresholdSweepTest, AcceptedIffConfidenceMeetsThreshold) {
    const auto p = GetParam();
    cfg.default_threshold = p.threshold;
    make_coordinator();
    input.request = make_png_request(WorkType::Concrete);

    auto result = run({scripted::local("yolo-large", Tier::LocalLarge, p.confidence),
                       scripted::local("yolo-small", Tier::LocalSmall, 0.01f)});

    EXPECT_EQ(result.provenance[0].outcome,
              p.accepted ? AttemptOutcome::Accepted : AttemptOutcome::LowConfidence);
    EXPECT_EQ(result.provenance.size(), p.accepted ? 1u : 2u);
    // Either way the large model's answer is the one returned
    EXPECT_EQ(result.source_backend, "yolo-large");
}

INSTANTIATE_TEST_SUITE_P(Thresholds, ThresholdSweepTest,
                         ::testing::Values(ThresholdParams{0.50f, 0.6f, false},
                                           ThresholdParams{0.60f, 0.6f, true},
                                           ThresholdParams{0.95f, 0.6f, true},
                                           ThresholdParams{0.69f, 0.7f, false},
                                           ThresholdParams{0.10f, 0.0f, true}));
