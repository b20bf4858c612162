#include "ConcurrencyGate.hpp"

#include <spdlog/spdlog.h>

#include "core/errors/Error.hpp"

namespace vindex {

void GateSemaphore::acquire() {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait(lk, [this] { return inUse_ < slots_; });
  ++inUse_;
}

bool GateSemaphore::tryAcquireFor(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!cv_.wait_for(lk, timeout, [this] { return inUse_ < slots_; })) return false;
  ++inUse_;
  return true;
}

void GateSemaphore::release() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (inUse_ > 0) --inUse_;
  }
  cv_.notify_one();
}

size_t GateSemaphore::inUse() const {
  std::lock_guard<std::mutex> lk(mu_);
  return inUse_;
}

void GateRegistry::registerGate(const std::string& name, size_t maxConcurrency) {
  if (maxConcurrency < 1) {
    throw Error(ErrorCode::InvalidArgument, "max_concurrency must be >= 1 for gate '" + name + "'");
  }
  std::lock_guard<std::mutex> lk(mu_);
  gates_[name] = std::make_shared<GateSemaphore>(maxConcurrency);
  spdlog::info("registered gate '{}' (max_concurrency={})", name, maxConcurrency);
}

bool GateRegistry::isRegistered(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  return gates_.count(name) != 0;
}

std::shared_ptr<GateSemaphore> GateRegistry::find(const std::string& name) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = gates_.find(name);
  if (it == gates_.end()) {
    throw Error(ErrorCode::GateMisconfigured, "no gate registered for '" + name + "'");
  }
  return it->second;
}

GateGuard GateRegistry::acquire(const std::string& name) {
  auto sem = find(name);
  sem->acquire();
  return GateGuard(std::move(sem));
}

GateGuard GateRegistry::acquireFor(const std::string& name, std::chrono::milliseconds timeout) {
  auto sem = find(name);
  if (!sem->tryAcquireFor(timeout)) {
    throw Error(ErrorCode::GateExhausted,
                "gate '" + name + "' busy for " + std::to_string(timeout.count()) + " ms");
  }
  return GateGuard(std::move(sem));
}

size_t GateRegistry::inUse(const std::string& name) const {
  return find(name)->inUse();
}

} // namespace vindex
