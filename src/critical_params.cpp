#include "jose/critical_params.hpp"

#include <algorithm>

#include "jose/logging.hpp"

namespace jose {

bool CriticalParamsPolicy::headerPasses(const Header& header) const {
  auto crit = header.criticalParams();
  if (crit.empty()) return true;

  // Both sets are ordered
  bool passes =
      std::includes(deferred_.begin(), deferred_.end(), crit.begin(), crit.end());
  if (!passes) {
    JOSE_LOG_DEBUG("Header lists critical parameters that are not deferred");
  }
  return passes;
}

}  // namespace jose
