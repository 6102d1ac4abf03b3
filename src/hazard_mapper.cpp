#include "hazard_mapper.hpp"

#include <algorithm>
#include <cmath>

HazardMapper::HazardMapper(HazardMapperConfig cfg) : cfg_(std::move(cfg)) {
  const auto fall = HazardType::FallProtection;
  const auto ppe = HazardType::PpeViolation;
  const auto elec = HazardType::Electrical;
  rules_ = {
      {"ladder", {fall, Severity::Medium, "1926.1053", "Ladder in use; check footing and tie-off"}},
      {"unprotected_edge", {fall, Severity::High, "1926.501", "Unprotected edge without guardrail"}},
      {"open_edge", {fall, Severity::High, "1926.501", "Open edge without guardrail"}},
      {"floor_opening", {fall, Severity::High, "1926.502", "Uncovered floor opening"}},
      {"roof_edge", {fall, Severity::High, "1926.501", "Work near roof edge"}},
      {"scaffold", {HazardType::Scaffolding, Severity::High, "1926.451", "Scaffold platform"}},
      {"scaffolding",
       {HazardType::Scaffolding, Severity::High, "1926.451", "Scaffold platform"}},
      {"no_hard_hat", {ppe, Severity::High, "1926.100", "Worker without hard hat"}},
      {"no_helmet", {ppe, Severity::High, "1926.100", "Worker without hard hat"}},
      {"no_safety_vest", {ppe, Severity::Medium, "1926.201", "Worker without hi-vis vest"}},
      {"no_vest", {ppe, Severity::Medium, "1926.201", "Worker without hi-vis vest"}},
      {"no_gloves", {ppe, Severity::Low, "1926.95", "Worker without hand protection"}},
      {"no_goggles", {ppe, Severity::Medium, "1926.102", "Worker without eye protection"}},
      {"exposed_wiring", {elec, Severity::Critical, "1926.416", "Exposed energised wiring"}},
      {"electrical_panel", {elec, Severity::High, "1926.417", "Open electrical panel"}},
      {"power_line", {elec, Severity::Critical, "1926.416", "Overhead power line"}},
      {"extension_cord", {elec, Severity::Medium, "1926.405", "Extension cord in walkway"}},
      {"fire", {HazardType::Fire, Severity::Critical, "1926.150", "Open flame"}},
      {"smoke", {HazardType::Fire, Severity::High, "1926.150", "Smoke"}},
      {"gas_cylinder", {HazardType::Fire, Severity::Medium, "1926.350", "Compressed gas cylinder"}},
      {"debris", {HazardType::Housekeeping, Severity::Low, "1926.25", "Debris in work area"}},
      {"tripping_hazard",
       {HazardType::Housekeeping, Severity::Low, "1926.25", "Tripping hazard in walkway"}},
      {"trench", {HazardType::Excavation, Severity::High, "1926.651", "Open trench"}},
      {"excavation", {HazardType::Excavation, Severity::High, "1926.651", "Open excavation"}},
      {"crane", {HazardType::CraneLift, Severity::High, "1926.1400", "Crane operating on site"}},
      {"suspended_load",
       {HazardType::CraneLift, Severity::Critical, "1926.1425", "Worker near suspended load"}},
      {"rotating_machinery",
       {HazardType::CaughtInEquipment, Severity::High, "1926.300", "Unguarded rotating parts"}},
  };
}

const HazardRule* HazardMapper::rule_for(const std::string& label) const {
  auto it = rules_.find(normalize_name(label));
  return it == rules_.end() ? nullptr : &it->second;
}

std::string HazardMapper::osha_code_for(HazardType t) {
  switch (t) {
    case HazardType::FallProtection: return "1926.501";
    case HazardType::PpeViolation: return "1926.95";
    case HazardType::Electrical: return "1926.416";
    case HazardType::StruckByObject: return "1926.600";
    case HazardType::CaughtInEquipment: return "1926.300";
    case HazardType::CraneLift: return "1926.1400";
    case HazardType::Fire: return "1926.150";
    case HazardType::Housekeeping: return "1926.25";
    case HazardType::Scaffolding: return "1926.451";
    case HazardType::Excavation: return "1926.651";
    case HazardType::ManualReview:
    case HazardType::Other: return "";
  }
  return "";
}

Region HazardMapper::normalise(const cv::Rect& r, const cv::Size& image_size) const {
  if (image_size.width <= 0 || image_size.height <= 0) return {};
  const float w = static_cast<float>(image_size.width);
  const float h = static_cast<float>(image_size.height);
  Region out;
  out.x = std::clamp(static_cast<float>(r.x) / w, 0.0f, 1.0f);
  out.y = std::clamp(static_cast<float>(r.y) / h, 0.0f, 1.0f);
  out.width = std::clamp(static_cast<float>(r.width) / w, 0.0f, 1.0f - out.x);
  out.height = std::clamp(static_cast<float>(r.height) / h, 0.0f, 1.0f - out.y);
  return out;
}

Severity HazardMapper::adjust_for_work_type(HazardType t, Severity s, WorkType w) const {
  bool escalate = false;
  switch (w) {
    case WorkType::Roofing:
    case WorkType::FallProtection:
    case WorkType::SteelErection:
      escalate = t == HazardType::FallProtection || t == HazardType::Scaffolding;
      break;
    case WorkType::Electrical:
      escalate = t == HazardType::Electrical;
      break;
    case WorkType::Excavation:
      escalate = t == HazardType::Excavation || t == HazardType::StruckByObject;
      break;
    case WorkType::CraneOperations:
      escalate = t == HazardType::CraneLift || t == HazardType::StruckByObject;
      break;
    case WorkType::Welding:
      escalate = t == HazardType::Fire;
      break;
    default:
      break;
  }
  if (!escalate || s == Severity::Critical) return s;
  return static_cast<Severity>(static_cast<int>(s) + 1);
}

std::vector<Hazard> HazardMapper::map(const std::vector<Detection>& detections,
                                      const cv::Size& image_size, WorkType work_type) const {
  std::vector<Hazard> hazards;
  std::vector<const Detection*> people;
  std::vector<const Detection*> equipment;

  for (const auto& det : detections) {
    const std::string label = normalize_name(det.label);
    if (label == "person") people.push_back(&det);
    if (cfg_.equipment_labels.count(label)) equipment.push_back(&det);

    const HazardRule* rule = rule_for(label);
    if (!rule) continue;
    Hazard h;
    h.type = rule->type;
    h.region = normalise(det.bbox, image_size);
    h.confidence = det.confidence;
    h.severity = adjust_for_work_type(rule->type, rule->severity, work_type);
    h.description = rule->description;
    h.osha_code = rule->osha_code;
    hazards.push_back(std::move(h));
  }

  // Worker inside the swing/travel radius of heavy equipment.
  const float diag = std::hypot(static_cast<float>(image_size.width),
                                static_cast<float>(image_size.height));
  if (diag > 0.0f) {
    for (const Detection* p : people) {
      for (const Detection* e : equipment) {
        const cv::Point2f d = p->center() - e->center();
        const float dist = std::hypot(d.x, d.y) / diag;
        if (dist >= cfg_.proximity_threshold) continue;
        Hazard h;
        h.type = HazardType::StruckByObject;
        h.region = normalise(p->bbox | e->bbox, image_size);
        h.confidence = std::min(p->confidence, e->confidence);
        h.severity = adjust_for_work_type(HazardType::StruckByObject, Severity::High, work_type);
        h.description = "Worker within reach of " + e->label;
        h.osha_code = osha_code_for(HazardType::StruckByObject);
        hazards.push_back(std::move(h));
      }
    }
  }
  return hazards;
}

float aggregate_confidence(const std::vector<Hazard>& hazards, float empty_scene_confidence) {
  if (hazards.empty()) return empty_scene_confidence;
  float sum = 0.0f;
  for (const auto& h : hazards) sum += h.confidence;
  return std::clamp(sum / static_cast<float>(hazards.size()), 0.0f, 1.0f);
}
