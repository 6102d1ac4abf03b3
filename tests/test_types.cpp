#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <unordered_set>
#include "errors.hpp"
#include "events.hpp"
#include "types.hpp"

class NameConversionTest : public ::testing::Test {};

TEST_F(NameConversionTest, WorkTypesRoundTripThroughNames) {
    for (WorkType w : all_work_types()) {
        EXPECT_EQ(work_type_from_string(to_string(w)), w) << to_string(w);
    }
    EXPECT_EQ(all_work_types().size(), 15u);
}

TEST_F(NameConversionTest, NamesAreNormalised) {
    EXPECT_EQ(normalize_name("Fall Protection"), "fall_protection");
    EXPECT_EQ(normalize_name("crane-operations"), "crane_operations");
    EXPECT_EQ(work_type_from_string("Steel Erection"), WorkType::SteelErection);
    EXPECT_EQ(tier_from_string("Local-Large"), Tier::LocalLarge);
}

TEST_F(NameConversionTest, UnknownNamesThrow) {
    EXPECT_THROW(work_type_from_string("underwater_welding"), std::invalid_argument);
    EXPECT_THROW(tier_from_string("edge_tpu"), std::invalid_argument);
}

TEST_F(NameConversionTest, ModelOutputNamesAreLenient) {
    EXPECT_EQ(severity_from_string("HIGH"), Severity::High);
    EXPECT_EQ(severity_from_string("catastrophic"), Severity::Medium);
    EXPECT_EQ(hazard_type_from_string("missing_hard_hat"), HazardType::PpeViolation);
    EXPECT_EQ(hazard_type_from_string("Trip Hazards"), HazardType::Housekeeping);
    EXPECT_EQ(hazard_type_from_string("alien_invasion"), HazardType::Other);
}

TEST_F(NameConversionTest, EnumNames) {
    EXPECT_EQ(to_string(Tier::Cloud), "cloud");
    EXPECT_EQ(to_string(Tier::LocalSmall), "local_small");
    EXPECT_EQ(to_string(ThermalLevel::Serious), "serious");
    EXPECT_EQ(to_string(NetworkReachability::Metered), "metered");
    EXPECT_EQ(to_string(DeviceClass::HighEnd), "high_end");
    EXPECT_EQ(to_string(AttemptOutcome::LowConfidence), "low_confidence");
    EXPECT_EQ(to_string(ErrorCode::AllBackendsFailed), "AllBackendsFailed");
}

TEST(TierTest, LocalTiers) {
    EXPECT_TRUE(is_local(Tier::LocalLarge));
    EXPECT_TRUE(is_local(Tier::LocalSmall));
    EXPECT_FALSE(is_local(Tier::Cloud));
    EXPECT_FALSE(is_local(Tier::Emergency));
}

TEST(CacheKeyTest, EqualityCoversFingerprintAndWorkType) {
    CacheKey a{"abc", WorkType::Roofing};
    CacheKey b{"abc", WorkType::Roofing};
    CacheKey c{"abc", WorkType::Electrical};
    CacheKey d{"abd", WorkType::Roofing};

    EXPECT_TRUE(a == b);
    EXPECT_FALSE(a == c);
    EXPECT_FALSE(a == d);
    EXPECT_EQ(CacheKeyHash()(a), CacheKeyHash()(b));

    std::unordered_set<CacheKey, CacheKeyHash> keys{a, b, c, d};
    EXPECT_EQ(keys.size(), 3u);
}

TEST(CacheKeyTest, DerivedFromRequest) {
    AnalysisRequest r;
    r.fingerprint = "f00d";
    r.work_type = WorkType::Welding;

    CacheKey k = cache_key_of(r);
    EXPECT_EQ(k.fingerprint, "f00d");
    EXPECT_EQ(k.work_type, WorkType::Welding);
}

TEST(ErrorTest, AnalysisErrorCarriesProvenance) {
    AttemptRecord rec;
    rec.backend = "cloud-vision";
    rec.tier = Tier::Cloud;
    rec.outcome = AttemptOutcome::TimedOut;

    AnalysisError err(ErrorCode::AllBackendsFailed, "every backend failed", {rec});
    EXPECT_EQ(err.code(), ErrorCode::AllBackendsFailed);
    ASSERT_EQ(err.provenance().size(), 1u);
    EXPECT_EQ(err.provenance()[0].backend, "cloud-vision");
    EXPECT_STREQ(err.what(), "every backend failed");
}

TEST(ErrorTest, SecurityRejectionCodes) {
    EXPECT_TRUE(is_security_rejection(ErrorCode::OversizedInput));
    EXPECT_TRUE(is_security_rejection(ErrorCode::MalformedInput));
    EXPECT_TRUE(is_security_rejection(ErrorCode::ModelIntegrityViolation));
    EXPECT_FALSE(is_security_rejection(ErrorCode::PromptInjectionAttempt));
    EXPECT_FALSE(is_security_rejection(ErrorCode::AllBackendsFailed));
}

TEST(EventTest, ResultSerialisation) {
    AnalysisResult r;
    r.request_id = 7;
    r.source_tier = Tier::LocalLarge;
    r.source_backend = "yolo-large";
    r.overall_confidence = 0.75f;
    Hazard h;
    h.type = HazardType::FallProtection;
    h.severity = Severity::Critical;
    h.osha_code = "1926.501";
    r.hazards.push_back(h);

    auto j = to_json(r);
    EXPECT_EQ(j["request_id"], 7);
    EXPECT_EQ(j["source_tier"], "local_large");
    EXPECT_EQ(j["source_backend"], "yolo-large");
    ASSERT_EQ(j["hazards"].size(), 1u);
    EXPECT_EQ(j["hazards"][0]["type"], "fall_protection");
    EXPECT_EQ(j["hazards"][0]["severity"], "critical");

    auto e = to_json(make_event(EventKind::CacheHit, 7, {{"fingerprint", "abc"}}));
    EXPECT_EQ(e["event"], "cache_hit");
    EXPECT_EQ(e["request_id"], 7);
    EXPECT_EQ(e["data"]["fingerprint"], "abc");
}

TEST(EventTest, JsonlSinkAppendsOneLinePerEvent) {
    auto path = std::filesystem::temp_directory_path() / "hazardscope_events_test" / "events.jsonl";
    std::filesystem::remove_all(path.parent_path());
    {
        JsonlEventSink sink(path.string());
        ASSERT_TRUE(sink.is_open());
        sink.emit(make_event(EventKind::AttemptStarted, 1));
        sink.emit(make_event(EventKind::AttemptFinished, 1));
    }

    std::ifstream in(path);
    std::string line;
    int lines = 0;
    while (std::getline(in, line)) {
        auto j = nlohmann::json::parse(line);
        EXPECT_EQ(j["request_id"], 1);
        ++lines;
    }
    EXPECT_EQ(lines, 2);
    std::filesystem::remove_all(path.parent_path());
}
