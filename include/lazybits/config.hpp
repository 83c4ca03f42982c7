/**
 * @file config.hpp
 * @brief lazybits compile-time configuration.
 *
 * @cond INTERNAL
 * ============================================================================
 *  _____                                   ____
 * |_   _|_ _ _ __   __ _  __ _ _ __ __ _  / ___| _ __   __ _  ___ ___
 *   | |/ _` | '_ \ / _` |/ _` | '__/ _` | \___ \| '_ \ / _` |/ __/ _ \
 *   | | (_| | | | | (_| | (_| | | | (_| |  ___) | |_) | (_| | (_|  __/
 *   |_|\__,_|_| |_|\__,_|\__, |_|  \__,_| |____/| .__/ \__,_|\___\___|
 *                        |___/                  |_|
 * ============================================================================
 * @endcond
 *
 * Lazy-loading decorator for bit-level codecs.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_CONFIG_HPP
#define LAZYBITS_CONFIG_HPP

#include <cstdint>
#include <cstddef>

namespace lazybits {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup config Configuration Constants
 * @{
 */

/// Widest value a single BitBuffer read may return, in bits
#ifndef LAZYBITS_MAX_READ_BITS
#define LAZYBITS_MAX_READ_BITS 64U
#endif

inline constexpr std::size_t MAX_READ_BITS = LAZYBITS_MAX_READ_BITS;

/** @} */

/**
 * @defgroup resolution Deferred Resolution Configuration
 *
 * LAZYBITS_SERIALIZE_FIRST_USE=1 guards the first access of every deferred
 * value with a per-value mutex, so concurrent first access decodes exactly
 * once. With 0, concurrent first access to one value is undefined behavior.
 *
 * LAZYBITS_RETRY_FAILED_RESOLVE=1 leaves a value unresolved after its
 * deferred decode throws, so the next access decodes again. With 0 (default)
 * the value is poisoned and rethrows the first failure on every access.
 * @{
 */
#ifndef LAZYBITS_SERIALIZE_FIRST_USE
#define LAZYBITS_SERIALIZE_FIRST_USE 1
#endif

#ifndef LAZYBITS_RETRY_FAILED_RESOLVE
#define LAZYBITS_RETRY_FAILED_RESOLVE 0
#endif

inline constexpr bool SERIALIZE_FIRST_USE = LAZYBITS_SERIALIZE_FIRST_USE != 0;
inline constexpr bool RETRY_FAILED_RESOLVE = LAZYBITS_RETRY_FAILED_RESOLVE != 0;
/** @} */

} // namespace lazybits

#endif // LAZYBITS_CONFIG_HPP
