#pragma once

// UNSPOOL Expected Type
//
// Exposes tl::expected in the unspool namespace for consistent error handling.
// Drivers return expected<T, DecodeError>; the API matches std::expected (C++23)
// using the TartanLlama implementation for C++20 compatibility.
//
// Usage:
//   unspool::expected<T, unspool::DecodeError> result = unspool::run(decoder, bytes);
//   if (result.has_value()) {
//       process(*result);
//   } else {
//       std::cerr << result.error().message();
//   }

#include <tl/expected.hpp>

namespace unspool {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace unspool
