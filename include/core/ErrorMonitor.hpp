#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pantheon::core {

  /**
 * @class ErrorMonitor
 * @brief Other threads call `notifyFailure()`; we call the registered
 *        escalation callback exactly once per unique error.
 *
 * * Thread-safe (mutex-protected map).
 * * Debounces duplicate failures so SystemCoordinator doesn't get spammed;
 *   repeats are still counted.
 * * The callback runs outside the lock.
 */
  class ErrorMonitor {
  public:
    using Escalation = std::function<void(const std::string&)>;

    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault to SystemCoordinator.
    void registerEscalation(Escalation cb);

    /// Called by subsystems on fault; will forward to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// How many times \p message has been reported (0 if never).
    std::uint64_t occurrences(const std::string& message) const;

    /// Total reports, duplicates included.
    std::uint64_t totalFailures() const;

  private:
    Escalation escalation_{};
    std::unordered_map<std::string, std::uint64_t> seen_; ///< de-dupe list + counts
    std::uint64_t total_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace pantheon::core
