#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using WallClock = std::chrono::system_clock;

// Trade context of a capture; drives thresholds and cloud priority.
enum class WorkType {
  GeneralConstruction,
  Electrical,
  Plumbing,
  Roofing,
  Scaffolding,
  Excavation,
  Concrete,
  Welding,
  Painting,
  Demolition,
  FallProtection,
  CraneOperations,
  SteelErection,
  Maintenance,
  Landscaping
};

// Ordered by accuracy/cost: cloud > local-large > local-small > emergency.
enum class Tier { Cloud, LocalLarge, LocalSmall, Emergency };

enum class ThermalLevel { Nominal = 0, Fair = 1, Serious = 2, Critical = 3 };

enum class NetworkReachability { None, Metered, Unmetered };

enum class DeviceClass { LowEnd, MidRange, HighEnd };

enum class Severity { Low = 0, Medium = 1, High = 2, Critical = 3 };

enum class HazardType {
  FallProtection,
  PpeViolation,
  Electrical,
  StruckByObject,
  CaughtInEquipment,
  CraneLift,
  Fire,
  Housekeeping,
  Scaffolding,
  Excavation,
  ManualReview,
  Other
};

enum class AttemptOutcome { Accepted, LowConfidence, Failed, TimedOut };

// Normalised [0,1] region, top-left origin.
struct Region {
  float x{0.0f}, y{0.0f}, width{0.0f}, height{0.0f};
};

struct Hazard {
  HazardType type{HazardType::Other};
  Region region;
  float confidence{0.0f};
  Severity severity{Severity::Low};
  std::string description;
  std::string osha_code;
};

struct ResourceRequirement {
  int min_memory_mb{0};
  bool needs_network{false};
  bool needs_gpu{false};
};

struct BackendDescriptor {
  std::string name;
  Tier tier{Tier::Emergency};
  int accuracy_class{0};  // higher is better
  double cost_per_call{0.0};
  int max_latency_ms{0};
  ResourceRequirement resources;
};

struct AttemptRecord {
  std::string backend;
  Tier tier{Tier::Emergency};
  AttemptOutcome outcome{AttemptOutcome::Failed};
  double latency_ms{0.0};
  float confidence{0.0f};
  std::string error;
};

struct AnalysisResult {
  uint64_t request_id{0};
  std::vector<Hazard> hazards;
  float overall_confidence{0.0f};
  Tier source_tier{Tier::Emergency};
  std::string source_backend;
  double total_cost{0.0};
  double total_latency_ms{0.0};
  std::vector<AttemptRecord> provenance;
};

struct FingerprintPolicy {
  int resize_width{640};
  int resize_height{640};
  bool letterbox{true};
};

// Immutable once built by make_request().
struct AnalysisRequest {
  uint64_t id{0};
  std::shared_ptr<const std::vector<uint8_t>> bytes;
  int width{0};
  int height{0};
  WorkType work_type{WorkType::GeneralConstruction};
  std::string note;  // user-controlled, interpolated into the cloud prompt
  std::string fingerprint;
  TimePoint created{};
};

struct CacheKey {
  std::string fingerprint;
  WorkType work_type{WorkType::GeneralConstruction};

  bool operator==(const CacheKey& o) const {
    return work_type == o.work_type && fingerprint == o.fingerprint;
  }
};

struct CacheKeyHash {
  size_t operator()(const CacheKey& k) const {
    return std::hash<std::string>()(k.fingerprint) ^
           (static_cast<size_t>(k.work_type) * 0x9e3779b97f4a7c15ULL);
  }
};

inline CacheKey cache_key_of(const AnalysisRequest& r) { return {r.fingerprint, r.work_type}; }

struct DeviceState {
  int available_memory_mb{0};
  int total_memory_mb{0};
  ThermalLevel thermal{ThermalLevel::Nominal};
  int battery_percent{100};
  bool charging{true};
  NetworkReachability network{NetworkReachability::Unmetered};
  bool accelerator_available{false};
  DeviceClass device_class{DeviceClass::MidRange};
};

std::string to_string(WorkType w);
std::string to_string(Tier t);
std::string to_string(ThermalLevel t);
std::string to_string(NetworkReachability n);
std::string to_string(DeviceClass d);
std::string to_string(Severity s);
std::string to_string(HazardType h);
std::string to_string(AttemptOutcome o);

// Throw std::invalid_argument on unknown names.
WorkType work_type_from_string(const std::string& s);
Tier tier_from_string(const std::string& s);

// Lenient: model output is free text, unknown names map to Medium / Other.
Severity severity_from_string(const std::string& s);
HazardType hazard_type_from_string(const std::string& s);

std::string normalize_name(const std::string& s);

const std::vector<WorkType>& all_work_types();

inline bool is_local(Tier t) { return t == Tier::LocalLarge || t == Tier::LocalSmall; }
