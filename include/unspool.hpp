#pragma once

/**
 * @file unspool.hpp
 * @brief Umbrella header for the unspool decoding engine
 *
 * Types provided:
 * - Decoder<T>: composable decoding computation (decoder.hpp)
 * - Result<T>: Fail / Partial / Done outcome of an incremental run (result.hpp)
 * - DecodeError: failure reason plus label trace (decode_error.hpp)
 * - ByteString / LazyByteString: sliceable input bytes (byte_string.hpp)
 *
 * Drivers (run.hpp):
 * - run(): one-shot decode of a complete input
 * - run_partial(): incremental decode, returns Result<T>
 * - run_with_remainder(): one-shot decode from an offset, also returns the tail
 *
 * For decoding records out of files, see unspool/unspool_io.hpp.
 */

#include "unspool/byte_string.hpp"
#include "unspool/bytes.hpp"
#include "unspool/containers.hpp"
#include "unspool/decode_error.hpp"
#include "unspool/decoder.hpp"
#include "unspool/either.hpp"
#include "unspool/expected.hpp"
#include "unspool/numeric.hpp"
#include "unspool/primitives.hpp"
#include "unspool/result.hpp"
#include "unspool/run.hpp"
