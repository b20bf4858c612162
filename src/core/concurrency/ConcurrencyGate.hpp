#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace vindex {

// Counting semaphore for one named resource.
class GateSemaphore {
public:
  explicit GateSemaphore(size_t slots) : slots_(slots), inUse_(0) {}

  void acquire();
  bool tryAcquireFor(std::chrono::milliseconds timeout);
  void release();

  size_t slots() const { return slots_; }
  size_t inUse() const;

private:
  const size_t slots_;
  size_t inUse_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
};

// Holds one slot; released when destroyed or moved-from object is reset.
class GateGuard {
public:
  GateGuard() = default;
  explicit GateGuard(std::shared_ptr<GateSemaphore> sem) : sem_(std::move(sem)) {}
  ~GateGuard() { release(); }

  GateGuard(GateGuard&& other) noexcept : sem_(std::move(other.sem_)) {}
  GateGuard& operator=(GateGuard&& other) noexcept {
    if (this != &other) {
      release();
      sem_ = std::move(other.sem_);
    }
    return *this;
  }
  GateGuard(const GateGuard&) = delete;
  GateGuard& operator=(const GateGuard&) = delete;

  bool held() const { return sem_ != nullptr; }
  void release() {
    if (sem_) {
      sem_->release();
      sem_.reset();
    }
  }

private:
  std::shared_ptr<GateSemaphore> sem_;
};

// Process-wide admission control keyed by resource name (e.g. one GPU).
// Acquiring an unregistered name throws GateMisconfigured; a timed acquire
// that runs out of time throws GateExhausted.
class GateRegistry {
public:
  // maxConcurrency < 1 throws InvalidArgument. Re-registering a name
  // replaces its gate; outstanding guards keep the old one alive.
  void registerGate(const std::string& name, size_t maxConcurrency);
  bool isRegistered(const std::string& name) const;

  GateGuard acquire(const std::string& name);
  GateGuard acquireFor(const std::string& name, std::chrono::milliseconds timeout);

  size_t inUse(const std::string& name) const;

private:
  std::shared_ptr<GateSemaphore> find(const std::string& name) const;

  mutable std::mutex mu_;
  std::map<std::string, std::shared_ptr<GateSemaphore>> gates_;
};

} // namespace vindex
