#include "geo_resolver/rate_limiter.hpp"

#include <spdlog/spdlog.h>

namespace geo_resolver {

void RateLimiter::set_resume_at(TimePoint resume_at) {
  if (!resume_at_ || *resume_at_ != resume_at) {
    ++windows_opened_;
    spdlog::warn("upstream rate limited, dispatch resumes at epoch_ms={}",
                 to_epoch_ms(resume_at));
  }
  resume_at_ = resume_at;
}

bool RateLimiter::is_blocked(TimePoint now) {
  if (!resume_at_)
    return false;
  if (now >= *resume_at_) {
    resume_at_.reset();
    return false;
  }
  return true;
}

Millis RateLimiter::remaining(TimePoint now) {
  if (!is_blocked(now))
    return Millis(0);
  // Rounded up so a sub-millisecond remainder never reads as zero.
  return std::chrono::ceil<Millis>(*resume_at_ - now);
}

} // namespace geo_resolver
