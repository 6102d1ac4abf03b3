#include "budget_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <ctime>

namespace {

struct CalendarKeys {
  int64_t day;
  int64_t month;
};

CalendarKeys calendar_keys(WallClock::time_point t) {
  const std::time_t tt = WallClock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  const int64_t day = static_cast<int64_t>(tt / 86400);
  const int64_t month = static_cast<int64_t>(tm.tm_year) * 12 + tm.tm_mon;
  return {day, month};
}

}  // namespace

double BudgetState::remaining() const {
  return std::min(daily_cap - daily_spend, monthly_cap - monthly_spend) - reserved;
}

BudgetManager::Micros BudgetManager::to_micros(double dollars) {
  return static_cast<Micros>(std::llround(dollars * 1'000'000.0));
}

double BudgetManager::to_dollars(Micros m) { return static_cast<double>(m) / 1'000'000.0; }

BudgetManager::BudgetManager(BudgetConfig cfg, std::shared_ptr<EventSink> events, WallSource now)
    : cfg_(cfg), events_(std::move(events)), now_(std::move(now)) {
  if (!now_) now_ = [] { return WallClock::now(); };
  daily_cap_ = to_micros(cfg_.daily_cap);
  monthly_cap_ = to_micros(cfg_.monthly_cap);
  last_reset_ = now_();
  const auto keys = calendar_keys(last_reset_);
  day_key_ = keys.day;
  month_key_ = keys.month;
}

void BudgetManager::roll_over_locked() {
  const auto now = now_();
  const auto keys = calendar_keys(now);
  bool reset = false;
  if (keys.day != day_key_) {
    spdlog::info("Budget: daily spend ${:.2f} reset on day rollover", to_dollars(daily_spend_));
    daily_spend_ = 0;
    day_key_ = keys.day;
    reset = true;
  }
  if (keys.month != month_key_) {
    spdlog::info("Budget: monthly spend ${:.2f} reset on month rollover",
                 to_dollars(monthly_spend_));
    monthly_spend_ = 0;
    month_key_ = keys.month;
    reset = true;
  }
  if (reset) {
    last_reset_ = now;
    emit_locked("reset", Reservation{}, 0.0);
  }
}

std::optional<Reservation> BudgetManager::check_and_reserve(double cost) {
  std::lock_guard<std::mutex> g(mu_);
  roll_over_locked();

  const Micros amount = std::max<Micros>(0, to_micros(cost));
  const Micros daily_left = daily_cap_ - daily_spend_ - reserved_total_;
  const Micros monthly_left = monthly_cap_ - monthly_spend_ - reserved_total_;
  if (amount > daily_left || amount > monthly_left) {
    spdlog::info("Budget exceeded: ${:.4f} requested, ${:.4f} left today, ${:.4f} this month",
                 to_dollars(amount), to_dollars(std::max<Micros>(0, daily_left)),
                 to_dollars(std::max<Micros>(0, monthly_left)));
    return std::nullopt;
  }

  Reservation r{next_id_++, to_dollars(amount)};
  reservations_[r.id] = amount;
  reserved_total_ += amount;
  emit_locked("reserve", r, r.amount);
  return r;
}

double BudgetManager::commit(const Reservation& r, double actual_cost) {
  std::lock_guard<std::mutex> g(mu_);
  roll_over_locked();

  auto it = reservations_.find(r.id);
  if (it == reservations_.end()) {
    spdlog::warn("Budget: commit for unknown reservation {}", r.id);
    return 0.0;
  }
  const Micros held = it->second;
  const Micros charge = std::max<Micros>(0, to_micros(actual_cost));
  if (charge > held) {
    spdlog::warn("Budget: metered cost ${:.4f} exceeds reservation ${:.4f}; charging metered cost",
                 to_dollars(charge), to_dollars(held));
  }
  reserved_total_ -= held;
  reservations_.erase(it);
  daily_spend_ += charge;
  monthly_spend_ += charge;
  emit_locked("commit", r, to_dollars(charge));
  return to_dollars(charge);
}

void BudgetManager::release(const Reservation& r) {
  std::lock_guard<std::mutex> g(mu_);
  auto it = reservations_.find(r.id);
  if (it == reservations_.end()) return;  // already settled
  reserved_total_ -= it->second;
  reservations_.erase(it);
  emit_locked("release", r, r.amount);
}

BudgetState BudgetManager::state() {
  std::lock_guard<std::mutex> g(mu_);
  roll_over_locked();
  return state_locked();
}

BudgetState BudgetManager::state_locked() const {
  BudgetState s;
  s.daily_spend = to_dollars(daily_spend_);
  s.monthly_spend = to_dollars(monthly_spend_);
  s.reserved = to_dollars(reserved_total_);
  s.daily_cap = to_dollars(daily_cap_);
  s.monthly_cap = to_dollars(monthly_cap_);
  s.last_reset = last_reset_;
  return s;
}

void BudgetManager::restore(double daily_spend, double monthly_spend,
                            WallClock::time_point last_reset) {
  std::lock_guard<std::mutex> g(mu_);
  daily_spend_ = to_micros(daily_spend);
  monthly_spend_ = to_micros(monthly_spend);
  last_reset_ = last_reset;
  const auto keys = calendar_keys(last_reset);
  day_key_ = keys.day;
  month_key_ = keys.month;
  roll_over_locked();
  emit_locked("restore", Reservation{}, 0.0);
}

void BudgetManager::emit_locked(const char* change, const Reservation& r, double amount) {
  if (!events_) return;
  const BudgetState s = state_locked();
  events_->emit(make_event(EventKind::BudgetChanged, 0,
                           {{"change", change},
                            {"reservation", r.id},
                            {"amount", amount},
                            {"daily_spend", s.daily_spend},
                            {"monthly_spend", s.monthly_spend},
                            {"reserved", s.reserved},
                            {"daily_cap", s.daily_cap},
                            {"monthly_cap", s.monthly_cap}}));
}
