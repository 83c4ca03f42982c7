/**
 * @file lazy.hpp
 * @brief Lazy-loading codec and the decorator that applies it.
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
 * LazyCodec<T> wraps another Codec<T>. Its decode() only moves the cursor
 * past the value and returns a Proxy<T>; the wrapped codec runs when a
 * member of that proxy is first called. Fields after a lazy field therefore
 * decode in stream order without waiting for it.
 *
 * LazyLoadingDecorator applies LazyCodec to fields marked
 * Annotation::LazyLoading and leaves every other codec untouched.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_LAZY_HPP
#define LAZYBITS_LAZY_HPP

#include "bitbuffer.hpp"
#include "codec.hpp"
#include "deferred.hpp"
#include "error.hpp"
#include "log.hpp"
#include "metadata.hpp"
#include "proxy.hpp"
#include "resolver.hpp"

#include <memory>
#include <string>
#include <typeinfo>
#include <utility>

namespace lazybits {

/**
 * @brief Codec that defers the wrapped codec's decode until first use.
 *
 * @tparam T Declared value type; needs a Proxy<T> specialization
 */
template <typename T> class LazyCodec final : public Codec<T> {
    static_assert(has_proxy_v<T>,
                  "LazyCodec<T> requires a polymorphic T and a Proxy<T> specialization");

public:
    /**
     * @brief Wrap a codec.
     *
     * @param wrapped Codec performing the real decode
     * @throws InvalidArgumentException if wrapped is null
     */
    explicit LazyCodec(CodecPtr<T> wrapped) : wrapped_(std::move(wrapped)) {
        if (!wrapped_) {
            throw InvalidArgumentException("LazyCodec requires a codec to wrap");
        }
    }

    /**
     * @brief Skip the value and return a placeholder for it.
     *
     * The cursor ends at its current position plus size(resolver). The
     * wrapped codec is not called.
     *
     * @throws SizeResolutionException if the size cannot be determined;
     *         cursor unchanged
     * @throws OverflowException if the value extends past the buffer;
     *         cursor unchanged
     */
    std::shared_ptr<T> decode(BitBuffer& buffer, const Resolver& resolver,
                              const Builder& builder) const override {
        const std::size_t bits = wrapped_->size(resolver);
        const std::size_t saved_position = buffer.position();
        buffer.skip(bits);

        logger()->trace("Deferred {} bits at bit {}", bits, saved_position);

        auto handle =
            std::make_shared<DeferredValue<T>>(wrapped_, buffer, saved_position, resolver, builder);
        return std::make_shared<Proxy<T>>(std::move(handle));
    }

    std::size_t size(const Resolver& resolver) const override {
        return wrapped_->size(resolver);
    }

    CodecDescriptor describe() const override {
        return wrapped_->describe();
    }

    std::type_index declared_type() const override {
        return typeid(T);
    }

    std::vector<std::type_index> related_types() const override {
        return wrapped_->related_types();
    }

    /**
     * @brief Codec performing the real decode.
     */
    [[nodiscard]] const CodecPtr<T>& wrapped() const noexcept {
        return wrapped_;
    }

private:
    CodecPtr<T> wrapped_;
};

/**
 * @brief Makes codecs of fields marked LazyLoading lazy.
 */
class LazyLoadingDecorator {
public:
    /**
     * @brief Wrap codec in a LazyCodec if the field is marked lazy.
     *
     * @tparam T Declared type of the field
     * @param codec Codec for the field
     * @param metadata Field declaration, or nullptr if there is none
     * @param context Scope the codec is built for
     * @return A new LazyCodec<T> for lazy fields, otherwise codec itself
     * @throws InvalidArgumentException if the field is lazy and codec is null
     * @throws ConfigurationException if the field is lazy but T has no
     *         Proxy<T> to stand in for it
     */
    template <typename T>
    CodecPtr<T> decorate(CodecPtr<T> codec, const FieldMetadata* metadata,
                         const ResolverContext& context) const {
        if (metadata == nullptr || !metadata->lazy_loading()) {
            return codec;
        }
        if (!codec) {
            throw InvalidArgumentException("Cannot lazy load field " + metadata->name() +
                                           " without a codec");
        }

        if constexpr (has_proxy_v<T>) {
            logger()->debug("Lazy loading {}.{} ({})", context.scope(), metadata->name(),
                            codec->describe().title);
            return std::make_shared<LazyCodec<T>>(std::move(codec));
        } else {
            throw ConfigurationException("Field " + context.scope() + "." + metadata->name() +
                                         " is marked lazy but " + typeid(T).name() +
                                         " has no Proxy to stand in for it");
        }
    }
};

} // namespace lazybits

#endif // LAZYBITS_LAZY_HPP
