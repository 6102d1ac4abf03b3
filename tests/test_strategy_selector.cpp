#include <gtest/gtest.h>
#include "strategy_selector.hpp"

class StrategySelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cloud.name = "cloud-vision";
        cloud.tier = Tier::Cloud;
        cloud.accuracy_class = 100;
        cloud.cost_per_call = 0.05;
        cloud.resources.needs_network = true;

        large.name = "yolo-large";
        large.tier = Tier::LocalLarge;
        large.accuracy_class = 80;
        large.resources.min_memory_mb = 1536;

        small.name = "yolo-small";
        small.tier = Tier::LocalSmall;
        small.accuracy_class = 50;
        small.resources.min_memory_mb = 512;

        emergency.name = "emergency-heuristic";
        emergency.tier = Tier::Emergency;

        device.total_memory_mb = 8192;
        device.available_memory_mb = 4096;

        budget.daily_cap = 5.0;
        budget.monthly_cap = 100.0;

        request.work_type = WorkType::GeneralConstruction;
    }

    StrategyPlan plan(const std::set<Tier>& disabled = {}) {
        return selector.select_order(request, device, budget, CacheOutcome::Miss,
                                     {emergency, small, cloud, large}, disabled);
    }

    static std::vector<std::string> names(const StrategyPlan& p) {
        std::vector<std::string> out;
        for (const auto& d : p.order) out.push_back(d.name);
        return out;
    }

    static bool excluded(const StrategyPlan& p, const std::string& name) {
        for (const auto& e : p.excluded) {
            if (e.backend == name) return true;
        }
        return false;
    }

    StrategySelector selector{StrategyConfig{}};
    BackendDescriptor cloud, large, small, emergency;
    DeviceState device;
    BudgetState budget;
    AnalysisRequest request;
};

TEST_F(StrategySelectorTest, CriticalWorkTypePutsCloudFirst) {
    request.work_type = WorkType::FallProtection;
    auto p = plan();
    EXPECT_EQ(names(p), (std::vector<std::string>{"cloud-vision", "yolo-large", "yolo-small",
                                                  "emergency-heuristic"}));
    EXPECT_TRUE(p.excluded.empty());
}

TEST_F(StrategySelectorTest, RoutineWorkTypePutsLocalLargeFirst) {
    auto p = plan();
    EXPECT_EQ(names(p), (std::vector<std::string>{"yolo-large", "cloud-vision", "yolo-small",
                                                  "emergency-heuristic"}));
}

TEST_F(StrategySelectorTest, ExhaustedBudgetExcludesCloud) {
    request.work_type = WorkType::Electrical;
    budget.daily_spend = 5.0;
    auto p = plan();
    EXPECT_TRUE(excluded(p, "cloud-vision"));
    EXPECT_EQ(p.order.front().name, "yolo-large");
    EXPECT_EQ(p.order.back().name, "emergency-heuristic");
}

TEST_F(StrategySelectorTest, UnaffordableCallExcludesCloud) {
    budget.daily_spend = 4.97;
    auto p = plan();
    EXPECT_TRUE(excluded(p, "cloud-vision"));
}

TEST_F(StrategySelectorTest, OutstandingReservationsCountAgainstBudget) {
    budget.daily_spend = 4.90;
    budget.reserved = 0.10;
    EXPECT_TRUE(excluded(plan(), "cloud-vision"));
}

TEST_F(StrategySelectorTest, OfflineExcludesCloud) {
    device.network = NetworkReachability::None;
    request.work_type = WorkType::CraneOperations;
    auto p = plan();
    EXPECT_TRUE(excluded(p, "cloud-vision"));
    EXPECT_EQ(names(p), (std::vector<std::string>{"yolo-large", "yolo-small",
                                                  "emergency-heuristic"}));
}

TEST_F(StrategySelectorTest, MeteredNetworkPolicy) {
    device.network = NetworkReachability::Metered;
    EXPECT_FALSE(excluded(plan(), "cloud-vision"));

    StrategyConfig cfg;
    cfg.allow_metered_cloud = false;
    selector = StrategySelector(cfg);
    EXPECT_TRUE(excluded(plan(), "cloud-vision"));
}

TEST_F(StrategySelectorTest, HotDeviceFallsBackToSmallModel) {
    device.thermal = ThermalLevel::Serious;
    auto p = plan();
    EXPECT_TRUE(excluded(p, "yolo-large"));
    EXPECT_EQ(names(p), (std::vector<std::string>{"yolo-small", "cloud-vision",
                                                  "emergency-heuristic"}));

    device.thermal = ThermalLevel::Fair;
    EXPECT_FALSE(excluded(plan(), "yolo-large"));
}

TEST_F(StrategySelectorTest, LowMemoryFallsBackToSmallModel) {
    device.available_memory_mb = 1024;
    request.work_type = WorkType::Scaffolding;
    auto p = plan();
    EXPECT_TRUE(excluded(p, "yolo-large"));
    EXPECT_EQ(names(p), (std::vector<std::string>{"cloud-vision", "yolo-small",
                                                  "emergency-heuristic"}));
}

TEST_F(StrategySelectorTest, UnknownMemoryIsNotPressure) {
    device.total_memory_mb = 0;
    device.available_memory_mb = 0;
    EXPECT_FALSE(excluded(plan(), "yolo-large"));
}

TEST_F(StrategySelectorTest, LowBatteryExcludesLargeUnlessCharging) {
    device.battery_percent = 10;
    device.charging = false;
    EXPECT_TRUE(excluded(plan(), "yolo-large"));

    device.charging = true;
    EXPECT_FALSE(excluded(plan(), "yolo-large"));
}

TEST_F(StrategySelectorTest, AcceleratorRequirement) {
    small.resources.needs_gpu = true;
    EXPECT_TRUE(excluded(plan(), "yolo-small"));

    device.accelerator_available = true;
    EXPECT_FALSE(excluded(plan(), "yolo-small"));
}

TEST_F(StrategySelectorTest, DisabledTiersAreDropped) {
    auto p = plan({Tier::LocalLarge, Tier::Emergency});
    EXPECT_TRUE(excluded(p, "yolo-large"));
    // Emergency is never removed
    EXPECT_EQ(p.order.back().name, "emergency-heuristic");
}

TEST_F(StrategySelectorTest, EmergencySurvivesWorstCase) {
    device.network = NetworkReachability::None;
    device.thermal = ThermalLevel::Critical;
    device.available_memory_mb = 100;
    budget.daily_spend = 5.0;

    auto p = plan();
    EXPECT_EQ(names(p), (std::vector<std::string>{"emergency-heuristic"}));
    EXPECT_EQ(p.excluded.size(), 3u);
}

TEST_F(StrategySelectorTest, TiesBrokenByAccuracy) {
    BackendDescriptor tuned = small;
    tuned.name = "yolo-small-tuned";
    tuned.accuracy_class = 60;

    auto p = selector.select_order(request, device, budget, CacheOutcome::Miss,
                                   {small, emergency, tuned});
    EXPECT_EQ(names(p), (std::vector<std::string>{"yolo-small-tuned", "yolo-small",
                                                  "emergency-heuristic"}));
}

TEST_F(StrategySelectorTest, CriticalWorkTypesAreConfigurable) {
    EXPECT_TRUE(selector.is_critical(WorkType::Electrical));
    EXPECT_FALSE(selector.is_critical(WorkType::Painting));

    StrategyConfig cfg;
    cfg.critical_work_types = {WorkType::Painting};
    selector = StrategySelector(cfg);
    request.work_type = WorkType::Painting;
    EXPECT_EQ(plan().order.front().name, "cloud-vision");
}
