#include "types.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, WorkType>& work_type_names() {
  static const std::unordered_map<std::string, WorkType> names = {
      {"general_construction", WorkType::GeneralConstruction},
      {"electrical", WorkType::Electrical},
      {"plumbing", WorkType::Plumbing},
      {"roofing", WorkType::Roofing},
      {"scaffolding", WorkType::Scaffolding},
      {"excavation", WorkType::Excavation},
      {"concrete", WorkType::Concrete},
      {"welding", WorkType::Welding},
      {"painting", WorkType::Painting},
      {"demolition", WorkType::Demolition},
      {"fall_protection", WorkType::FallProtection},
      {"crane_operations", WorkType::CraneOperations},
      {"steel_erection", WorkType::SteelErection},
      {"maintenance", WorkType::Maintenance},
      {"landscaping", WorkType::Landscaping},
  };
  return names;
}

}  // namespace

std::string normalize_name(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == ' ' || c == '-') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
  }
  return out;
}

const std::vector<WorkType>& all_work_types() {
  static const std::vector<WorkType> all = {
      WorkType::GeneralConstruction, WorkType::Electrical,     WorkType::Plumbing,
      WorkType::Roofing,             WorkType::Scaffolding,    WorkType::Excavation,
      WorkType::Concrete,            WorkType::Welding,        WorkType::Painting,
      WorkType::Demolition,          WorkType::FallProtection, WorkType::CraneOperations,
      WorkType::SteelErection,       WorkType::Maintenance,    WorkType::Landscaping};
  return all;
}

std::string to_string(WorkType w) {
  for (const auto& kv : work_type_names()) {
    if (kv.second == w) return kv.first;
  }
  return "general_construction";
}

WorkType work_type_from_string(const std::string& s) {
  auto it = work_type_names().find(normalize_name(s));
  if (it == work_type_names().end()) {
    throw std::invalid_argument("unknown work type: " + s);
  }
  return it->second;
}

std::string to_string(Tier t) {
  switch (t) {
    case Tier::Cloud: return "cloud";
    case Tier::LocalLarge: return "local_large";
    case Tier::LocalSmall: return "local_small";
    case Tier::Emergency: return "emergency";
  }
  return "emergency";
}

Tier tier_from_string(const std::string& s) {
  const std::string n = normalize_name(s);
  if (n == "cloud") return Tier::Cloud;
  if (n == "local_large") return Tier::LocalLarge;
  if (n == "local_small") return Tier::LocalSmall;
  if (n == "emergency") return Tier::Emergency;
  throw std::invalid_argument("unknown backend tier: " + s);
}

std::string to_string(ThermalLevel t) {
  switch (t) {
    case ThermalLevel::Nominal: return "nominal";
    case ThermalLevel::Fair: return "fair";
    case ThermalLevel::Serious: return "serious";
    case ThermalLevel::Critical: return "critical";
  }
  return "nominal";
}

std::string to_string(NetworkReachability n) {
  switch (n) {
    case NetworkReachability::None: return "none";
    case NetworkReachability::Metered: return "metered";
    case NetworkReachability::Unmetered: return "unmetered";
  }
  return "none";
}

std::string to_string(DeviceClass d) {
  switch (d) {
    case DeviceClass::LowEnd: return "low_end";
    case DeviceClass::MidRange: return "mid_range";
    case DeviceClass::HighEnd: return "high_end";
  }
  return "mid_range";
}

std::string to_string(Severity s) {
  switch (s) {
    case Severity::Low: return "low";
    case Severity::Medium: return "medium";
    case Severity::High: return "high";
    case Severity::Critical: return "critical";
  }
  return "low";
}

Severity severity_from_string(const std::string& s) {
  const std::string n = normalize_name(s);
  if (n == "low") return Severity::Low;
  if (n == "high") return Severity::High;
  if (n == "critical") return Severity::Critical;
  return Severity::Medium;
}

std::string to_string(HazardType h) {
  switch (h) {
    case HazardType::FallProtection: return "fall_protection";
    case HazardType::PpeViolation: return "ppe_violation";
    case HazardType::Electrical: return "electrical";
    case HazardType::StruckByObject: return "struck_by_object";
    case HazardType::CaughtInEquipment: return "caught_in_equipment";
    case HazardType::CraneLift: return "crane_lift";
    case HazardType::Fire: return "fire";
    case HazardType::Housekeeping: return "housekeeping";
    case HazardType::Scaffolding: return "scaffolding";
    case HazardType::Excavation: return "excavation";
    case HazardType::ManualReview: return "manual_review";
    case HazardType::Other: return "other";
  }
  return "other";
}

HazardType hazard_type_from_string(const std::string& s) {
  static const std::unordered_map<std::string, HazardType> names = {
      {"fall_protection", HazardType::FallProtection},
      {"fall_hazard", HazardType::FallProtection},
      {"unguarded_edge", HazardType::FallProtection},
      {"ppe_violation", HazardType::PpeViolation},
      {"missing_hard_hat", HazardType::PpeViolation},
      {"missing_safety_vest", HazardType::PpeViolation},
      {"electrical", HazardType::Electrical},
      {"electrical_hazard", HazardType::Electrical},
      {"electrical_safety", HazardType::Electrical},
      {"struck_by_object", HazardType::StruckByObject},
      {"caught_in_equipment", HazardType::CaughtInEquipment},
      {"mechanical_hazard", HazardType::CaughtInEquipment},
      {"crane_lift", HazardType::CraneLift},
      {"crane_lifting", HazardType::CraneLift},
      {"fire", HazardType::Fire},
      {"fire_hazard", HazardType::Fire},
      {"housekeeping", HazardType::Housekeeping},
      {"trip_hazards", HazardType::Housekeeping},
      {"scaffolding", HazardType::Scaffolding},
      {"scaffolding_unsafe", HazardType::Scaffolding},
      {"excavation", HazardType::Excavation},
      {"manual_review", HazardType::ManualReview},
  };
  auto it = names.find(normalize_name(s));
  return it == names.end() ? HazardType::Other : it->second;
}

std::string to_string(AttemptOutcome o) {
  switch (o) {
    case AttemptOutcome::Accepted: return "accepted";
    case AttemptOutcome::LowConfidence: return "low_confidence";
    case AttemptOutcome::Failed: return "failed";
    case AttemptOutcome::TimedOut: return "timed_out";
  }
  return "failed";
}
