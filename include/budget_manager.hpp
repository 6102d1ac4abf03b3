#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "events.hpp"
#include "types.hpp"

struct BudgetConfig {
  double daily_cap = 5.00;
  double monthly_cap = 100.00;
};

// Snapshot of spend; amounts in dollars.
struct BudgetState {
  double daily_spend{0.0};
  double monthly_spend{0.0};
  double reserved{0.0};
  double daily_cap{0.0};
  double monthly_cap{0.0};
  WallClock::time_point last_reset{};

  double remaining() const;
  bool exhausted() const { return remaining() <= 0.0; }
  bool can_afford(double cost) const { return cost <= remaining() + 1e-9; }
};

struct Reservation {
  uint64_t id{0};
  double amount{0.0};
};

// Reservation-based spend tracking. Check-and-reserve, commit and release are
// atomic with respect to each other. Reservations never exceed either cap; a
// metered commit above its reservation is charged in full.
class BudgetManager {
public:
  using WallSource = std::function<WallClock::time_point()>;

  explicit BudgetManager(BudgetConfig cfg, std::shared_ptr<EventSink> events = nullptr,
                         WallSource now = nullptr);

  // nullopt when the cost does not fit under both caps (BudgetExceeded).
  std::optional<Reservation> check_and_reserve(double cost);

  // Charges actual_cost and returns the charged amount. Overage beyond the
  // reservation is logged and still charged.
  double commit(const Reservation& r, double actual_cost);

  // Refunds the reservation in full.
  void release(const Reservation& r);

  BudgetState state();

  // Seeds spend from an external store; caps come from config.
  void restore(double daily_spend, double monthly_spend, WallClock::time_point last_reset);

private:
  using Micros = int64_t;

  static Micros to_micros(double dollars);
  static double to_dollars(Micros m);

  void roll_over_locked();
  BudgetState state_locked() const;
  void emit_locked(const char* change, const Reservation& r, double amount);

  BudgetConfig cfg_;
  std::shared_ptr<EventSink> events_;
  WallSource now_;

  std::mutex mu_;
  Micros daily_cap_{0};
  Micros monthly_cap_{0};
  Micros daily_spend_{0};
  Micros monthly_spend_{0};
  Micros reserved_total_{0};
  std::unordered_map<uint64_t, Micros> reservations_;
  uint64_t next_id_{1};
  int64_t day_key_{0};
  int64_t month_key_{0};
  WallClock::time_point last_reset_{};
};
