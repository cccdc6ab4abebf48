/**
 * @file critical_params.hpp
 * @brief Acceptance policy for the "crit" header parameter (RFC 7515
 * section 4.1.11)
 */

#pragma once

#include <set>
#include <string>

#include "header.hpp"

namespace jose {

/**
 * @brief Set of critical parameters the application handles itself
 *
 * No critical parameter is processed by this library, so a header passes
 * only when every name it lists in "crit" has been deferred to the
 * application.
 */
class CriticalParamsPolicy {
 public:
  CriticalParamsPolicy() = default;

  explicit CriticalParamsPolicy(std::set<std::string> deferred)
      : deferred_(std::move(deferred)) {}

  /// Always empty
  [[nodiscard]] std::set<std::string> processedParams() const { return {}; }

  [[nodiscard]] const std::set<std::string>& deferredParams() const noexcept {
    return deferred_;
  }

  [[nodiscard]] bool headerPasses(const Header& header) const;

 private:
  std::set<std::string> deferred_;
};

}  // namespace jose
