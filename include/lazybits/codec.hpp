/**
 * @file codec.hpp
 * @brief Codec interface shared by eager and lazy codecs.
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
 * A codec reads one typed value from a BitBuffer starting at its cursor and
 * reports how many bits that value occupies. Codecs hold no per-decode
 * state: one instance is reused for every decode, from any thread.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_CODEC_HPP
#define LAZYBITS_CODEC_HPP

#include "bitbuffer.hpp"
#include "config.hpp"
#include "descriptor.hpp"
#include "resolver.hpp"

#include <memory>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace lazybits {

/**
 * @brief Reads values of type T from a bit buffer.
 *
 * @tparam T Type of the decoded value. Lazy loading requires T to be a
 *           polymorphic interface (see proxy.hpp).
 */
template <typename T> class Codec {
public:
    using value_type = T;

    virtual ~Codec() = default;

    /**
     * @brief Decode a value starting at the buffer's cursor.
     *
     * Leaves the cursor just past the value.
     *
     * @param buffer Buffer to read from
     * @param resolver Values already decoded
     * @param builder Factory for the returned instance
     * @return Decoded value, never null
     * @throws DecodingException (or a subclass) on failure
     */
    virtual std::shared_ptr<T> decode(BitBuffer& buffer, const Resolver& resolver,
                                      const Builder& builder) const = 0;

    /**
     * @brief Number of bits the next decoded value occupies.
     *
     * Must not read from any buffer.
     *
     * @throws SizeResolutionException if the size depends on something the
     *         resolver cannot provide
     */
    virtual std::size_t size(const Resolver& resolver) const = 0;

    /**
     * @brief Describe what this codec reads.
     */
    virtual CodecDescriptor describe() const = 0;

    /**
     * @brief Type callers receive from decode().
     */
    virtual std::type_index declared_type() const {
        return typeid(T);
    }

    /**
     * @brief Concrete types decode() may produce.
     */
    virtual std::vector<std::type_index> related_types() const {
        return {typeid(T)};
    }
};

template <typename T> using CodecPtr = std::shared_ptr<const Codec<T>>;

} // namespace lazybits

#endif // LAZYBITS_CODEC_HPP
