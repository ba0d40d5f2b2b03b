#pragma once

#include "geo_resolver/types.hpp"

#include <cstdint>
#include <optional>

namespace geo_resolver {

// Process-wide "resume at" window. Whoever observes the upstream's rate-limit
// signal calls set_resume_at; the request queue only reads it.
class RateLimiter {
public:
  void set_resume_at(TimePoint resume_at);
  void clear() { resume_at_.reset(); }

  // Clears an elapsed window as a side effect.
  bool is_blocked(TimePoint now);
  Millis remaining(TimePoint now);

  std::optional<TimePoint> resume_at() const { return resume_at_; }
  std::uint64_t windows_opened() const { return windows_opened_; }

private:
  std::optional<TimePoint> resume_at_;
  std::uint64_t windows_opened_{0};
};

} // namespace geo_resolver
