/**
 * @file lazybits.hpp
 * @brief lazybits public API.
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
 * Includes every lazybits header.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_HPP
#define LAZYBITS_HPP

#include "bitbuffer.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "deferred.hpp"
#include "descriptor.hpp"
#include "error.hpp"
#include "lazy.hpp"
#include "log.hpp"
#include "metadata.hpp"
#include "proxy.hpp"
#include "resolver.hpp"

namespace lazybits {

/**
 * @brief Get library version string.
 * @return Version string (e.g., "1.0.0")
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace lazybits

#endif // LAZYBITS_HPP
