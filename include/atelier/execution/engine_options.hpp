#pragma once

#include <atelier/schema/primitives.hpp>

namespace atelier::execution {

inline constexpr atelier::schema::duration_seconds_t kDefaultRenewalThreshold =
    6 * 24 * 60 * 60;
inline constexpr atelier::schema::duration_seconds_t kDefaultTargetRetention =
    30 * 24 * 60 * 60;

struct engine_options final {
  /// Principal that holds funded escrows until release or reclaim.
  atelier::schema::principal_id_t custody{};
  /// Renew a retention hint once less than this much remains.
  atelier::schema::duration_seconds_t renewal_threshold{
      kDefaultRenewalThreshold};
  atelier::schema::duration_seconds_t target_retention{
      kDefaultTargetRetention};
  /// When false, signed transactions skip signature verification.
  bool require_strict_crypto{true};
};

}  // namespace atelier::execution
