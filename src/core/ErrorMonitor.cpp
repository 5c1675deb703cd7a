/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault funnel
 *
 * © 2025 Pantheon RFID Systems — MIT-licensed.
 */

#include "core/ErrorMonitor.hpp"

namespace pantheon {
  namespace core {

    void ErrorMonitor::registerEscalation(Escalation cb) {
      std::lock_guard<std::mutex> lk(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) {
      Escalation forward;
      {
        std::lock_guard<std::mutex> lk(mtx_);
        ++total_;
        if (++seen_[message] > 1)
          return;
        forward = escalation_;
      }
      if (forward)
        forward(message);
    }

    std::uint64_t ErrorMonitor::occurrences(const std::string& message) const {
      std::lock_guard<std::mutex> lk(mtx_);
      auto it = seen_.find(message);
      return it == seen_.end() ? 0 : it->second;
    }

    std::uint64_t ErrorMonitor::totalFailures() const {
      std::lock_guard<std::mutex> lk(mtx_);
      return total_;
    }

  } // namespace core
} // namespace pantheon
