#include "fallback_coordinator.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <algorithm>

using namespace std::chrono;

float CoordinatorConfig::threshold_for(WorkType w) const {
  auto it = thresholds.find(w);
  return it == thresholds.end() ? default_threshold : it->second;
}

milliseconds CoordinatorConfig::timeout_for(Tier t, DeviceClass c) const {
  auto it = timeouts.find(t);
  const milliseconds base = it == timeouts.end() ? milliseconds(10000) : it->second;
  double scale = 1.0;
  if (c == DeviceClass::LowEnd) scale = low_end_timeout_scale;
  if (c == DeviceClass::HighEnd) scale = high_end_timeout_scale;
  return milliseconds(static_cast<int64_t>(static_cast<double>(base.count()) * scale));
}

FallbackCoordinator::FallbackCoordinator(CoordinatorConfig cfg, TaskRunner& runner,
                                         BudgetManager& budget, ConcurrencyGate& accelerator,
                                         ConcurrencyGate& cloud_gate, MetricsRegistry* metrics,
                                         std::shared_ptr<EventSink> events)
    : cfg_(std::move(cfg)),
      runner_(runner),
      budget_(budget),
      accelerator_(accelerator),
      cloud_gate_(cloud_gate),
      metrics_(metrics),
      events_(std::move(events)) {}

ConcurrencyGate* FallbackCoordinator::gate_for(const Backend& b) {
  // Local tiers share one execution context on the device.
  if (is_local(b.tier())) return &accelerator_;
  if (b.tier() == Tier::Cloud) return &cloud_gate_;
  return nullptr;
}

void FallbackCoordinator::finish(uint64_t request_id, const AttemptRecord& rec) {
  if (rec.outcome == AttemptOutcome::Accepted) {
    spdlog::info("Request {}: {} accepted (confidence {:.2f}, {:.1f}ms)", request_id,
                 rec.backend, rec.confidence, rec.latency_ms);
  } else {
    spdlog::debug("Request {}: {} {} ({:.1f}ms){}{}", request_id, rec.backend,
                  to_string(rec.outcome), rec.latency_ms, rec.error.empty() ? "" : ": ",
                  rec.error);
  }
  if (metrics_) metrics_->record_attempt(rec);
  if (events_) events_->emit(make_event(EventKind::AttemptFinished, request_id, to_json(rec)));
}

AnalysisResult FallbackCoordinator::make_result(const AnalysisRequest& req, const Candidate& c,
                                                std::vector<AttemptRecord> provenance,
                                                double total_cost, TimePoint started) const {
  AnalysisResult r;
  r.request_id = req.id;
  r.hazards = c.reply.hazards;
  r.overall_confidence = c.reply.confidence;
  r.source_tier = c.backend->tier();
  r.source_backend = c.backend->name();
  r.total_cost = total_cost;
  r.total_latency_ms = duration<double, std::milli>(Clock::now() - started).count();
  r.provenance = std::move(provenance);
  return r;
}

AnalysisResult FallbackCoordinator::run(const std::vector<Backend>& ordered,
                                        const BackendInput& input, DeviceClass device_class,
                                        const CancelToken& token) {
  const AnalysisRequest& req = input.request;
  const TimePoint started = Clock::now();
  const float threshold = cfg_.threshold_for(req.work_type);

  std::vector<AttemptRecord> provenance;
  std::optional<Candidate> best;
  double total_cost = 0.0;

  for (const Backend& backend : ordered) {
    if (token.cancelled()) {
      throw AnalysisError(ErrorCode::Cancelled, "analysis cancelled", provenance);
    }
    const BackendDescriptor& d = backend.descriptor();

    std::optional<Reservation> reservation;
    if (d.cost_per_call > 0.0) {
      reservation = budget_.check_and_reserve(d.cost_per_call);
      if (!reservation) {
        // Spend moved since the plan was made; the tier is dropped, not failed.
        spdlog::info("Request {}: {} skipped, {}", req.id, d.name,
                     to_string(ErrorCode::BudgetExceeded));
        continue;
      }
    }

    AttemptRecord rec;
    rec.backend = d.name;
    rec.tier = d.tier;
    if (events_) {
      events_->emit(make_event(EventKind::AttemptStarted, req.id,
                               {{"backend", d.name}, {"tier", to_string(d.tier)}}));
    }

    const milliseconds timeout = cfg_.timeout_for(d.tier, device_class);
    const TimePoint attempt_start = Clock::now();
    const TimePoint deadline = attempt_start + timeout;
    CancelToken attempt = token.child();
    ConcurrencyGate* gate = gate_for(backend);

    auto done = std::make_shared<CompletionSignal>();
    std::future<BackendReply> fut =
        runner_.submit([backend, input, attempt, gate, deadline, done]() -> BackendReply {
          SignalOnExit finished(done);
          GatePermit permit;
          if (gate) {
            switch (gate->acquire(attempt, deadline)) {
              case AcquireStatus::Acquired:
                permit = GatePermit(gate);
                break;
              case AcquireStatus::TimedOut:
                throw AnalysisError(ErrorCode::BackendTimeout, "timed out waiting for resource lock");
              case AcquireStatus::Cancelled:
                throw AnalysisError(ErrorCode::Cancelled, "cancelled waiting for resource lock");
            }
          }
          return backend.analyze(input, attempt);
        });

    bool cancelled = false;
    bool timed_out = false;
    if (!done->wait_until(token, deadline)) {
      if (token.cancelled()) {
        cancelled = true;
      } else {
        timed_out = true;
      }
    }

    std::optional<BackendReply> reply;
    if (!cancelled && !timed_out) {
      try {
        reply = fut.get();
      } catch (const AnalysisError& e) {
        if (e.code() == ErrorCode::Cancelled && token.cancelled()) {
          cancelled = true;
        } else {
          rec.outcome = e.code() == ErrorCode::BackendTimeout ? AttemptOutcome::TimedOut
                                                              : AttemptOutcome::Failed;
          rec.error = e.what();
        }
      } catch (const std::exception& e) {
        rec.outcome = AttemptOutcome::Failed;
        rec.error = e.what();
      }
    }
    rec.latency_ms = duration<double, std::milli>(Clock::now() - attempt_start).count();

    if (!reply) {
      // The task keeps running until it observes the cancelled attempt token.
      attempt.cancel();
      if (reservation) budget_.release(*reservation);
      if (cancelled) {
        rec.outcome = AttemptOutcome::Failed;
        rec.error = "cancelled";
        provenance.push_back(rec);
        finish(req.id, rec);
        throw AnalysisError(ErrorCode::Cancelled, "analysis cancelled", provenance);
      }
      if (timed_out) {
        rec.outcome = AttemptOutcome::TimedOut;
        rec.error = fmt::format("no reply within {}ms", timeout.count());
      }
      provenance.push_back(rec);
      finish(req.id, rec);
      continue;
    }

    const double charged = reservation ? budget_.commit(*reservation, reply->actual_cost) : 0.0;
    reply->actual_cost = charged;
    total_cost += charged;
    rec.confidence = reply->confidence;

    if (reply->confidence >= threshold) {
      rec.outcome = AttemptOutcome::Accepted;
      provenance.push_back(rec);
      finish(req.id, rec);
      return make_result(req, Candidate{std::move(*reply), &backend}, std::move(provenance),
                         total_cost, started);
    }

    rec.outcome = AttemptOutcome::LowConfidence;
    rec.error = fmt::format("confidence {:.2f} below {:.2f}", reply->confidence, threshold);
    provenance.push_back(rec);
    finish(req.id, rec);
    if (!best || reply->confidence > best->reply.confidence) {
      best = Candidate{std::move(*reply), &backend};
    }
  }

  if (best) {
    spdlog::warn("Request {}: no attempt met threshold {:.2f}, returning best candidate from {}",
                 req.id, threshold, best->backend->name());
    return make_result(req, *best, std::move(provenance), total_cost, started);
  }

  spdlog::error("Request {}: {} after {} attempts", req.id,
                to_string(ErrorCode::AllBackendsFailed), provenance.size());
  throw AnalysisError(ErrorCode::AllBackendsFailed,
                      fmt::format("all {} backend attempts failed", provenance.size()),
                      std::move(provenance));
}
