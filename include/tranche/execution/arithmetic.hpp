#pragma once

#include <tranche/common/critical.hpp>
#include <tranche/schema/primitives.hpp>
#include <limits>
#include <optional>

namespace tranche::execution {

/// floor(value * numerator / denominator) with a 512-bit intermediate.
///
/// Callers pass `numerator <= denominator` (a share of a whole), so the
/// result never exceeds `value`.
inline tranche::schema::amount_t mul_div(
    const tranche::schema::amount_t& value,
    const tranche::schema::amount_t& numerator,
    const tranche::schema::amount_t& denominator) {
  if (denominator == 0) {
    tranche::common::critical("mul_div called with zero denominator");
  }
  auto product = tranche::schema::wide_amount_t(value) *
                 tranche::schema::wide_amount_t(numerator);
  auto quotient = product / tranche::schema::wide_amount_t(denominator);
  if (quotient > tranche::schema::wide_amount_t(
                     std::numeric_limits<tranche::schema::amount_t>::max())) {
    tranche::common::critical("mul_div result exceeds 256 bits");
  }
  return quotient.convert_to<tranche::schema::amount_t>();
}

inline std::optional<tranche::schema::amount_t> checked_add(
    const tranche::schema::amount_t& lhs,
    const tranche::schema::amount_t& rhs) {
  if (lhs > std::numeric_limits<tranche::schema::amount_t>::max() - rhs) {
    return std::nullopt;
  }
  return lhs + rhs;
}

}  // namespace tranche::execution
