#pragma once

// WARY Expected Type
//
// Every fallible wary operation returns tl::expected, re-exported here so
// parse functions can spell it as wary::expected<T, E>.
//
// Usage:
//   wary::expected<uint8_t, E> version = r.read_u8();
//   if (!version) {
//       return wary::unexpected(std::move(version.error()));
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain another read on success
//   result.map(f)       - transform the value read
//   result.map_error(f) - convert to a cheaper error form

#include <tl/expected.hpp>

namespace wary {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace wary
