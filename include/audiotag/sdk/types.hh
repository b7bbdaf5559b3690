/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef AUDIOTAG_SDK_TYPES_H
#define AUDIOTAG_SDK_TYPES_H

#include <cstdint>
#include <cstddef>
#include <chrono>

namespace audiotag {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk_types
 * @brief Core type definitions for container parsing
 *
 * Container headers store audio parameters with varying widths (16-bit
 * channel counts in RIFF, 3-bit in FLAC stream-info, 32-bit in DSF). The
 * aliases below are the widths every parser normalises to.
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Type for audio sample rates in Hz
 *
 * Common values include 44100 (CD), 48000 (Opus, DAT) and
 * 2822400 (DSD64).
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Type for audio channel count
 */
using channels_t = uint16_t;

/**
 * @typedef duration_t
 * @brief Playback duration
 *
 * Zero means "unknown".
 */
using duration_t = std::chrono::nanoseconds;

/** @} */ // end of sdk_types group

} // namespace audiotag

#endif // AUDIOTAG_SDK_TYPES_H
