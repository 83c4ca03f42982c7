/**
 * @file lazy.cpp
 * @brief Lazy codec compilation unit.
 *
 * LazyCodec, DeferredValue and ProxyBase are templates over the declared
 * value type and live in their headers:
 * - deferred.hpp: first-use decode and caching
 * - proxy.hpp:    placeholders forwarding to the decoded value
 * - lazy.hpp:     LazyCodec and LazyLoadingDecorator
 *
 * This file checks the headers compile on their own.
 */

#include <lazybits/lazybits.hpp>

// All implementation is in the headers (template classes)
