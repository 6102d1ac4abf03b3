#pragma once
#include <memory>
#include <string>
#include <variant>

#include "backend_io.hpp"
#include "cloud_backend.hpp"
#include "concurrency.hpp"
#include "emergency_backend.hpp"
#include "local_backend.hpp"

// One analyze contract over the closed set of backend kinds. Copies share the
// underlying implementation, so a copy handed to an attempt task stays valid
// after the caller has moved on.
class Backend {
public:
  using Impl = std::variant<CloudBackend, LocalBackend, EmergencyBackend>;

  explicit Backend(CloudBackend b) : impl_(std::make_shared<const Impl>(std::move(b))) {}
  explicit Backend(LocalBackend b) : impl_(std::make_shared<const Impl>(std::move(b))) {}
  explicit Backend(EmergencyBackend b) : impl_(std::make_shared<const Impl>(std::move(b))) {}

  const BackendDescriptor& descriptor() const;
  const std::string& name() const { return descriptor().name; }
  Tier tier() const { return descriptor().tier; }

  // Artifact to integrity-check before first use; empty when there is none.
  std::string model_path() const;

  // Throws BackendError on failure, AnalysisError(Cancelled) when cancelled.
  BackendReply analyze(const BackendInput& input, const CancelToken& token) const;

  const Impl& impl() const { return *impl_; }

private:
  std::shared_ptr<const Impl> impl_;
};
