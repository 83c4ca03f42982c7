/**
 * @file resolver.hpp
 * @brief Decode contexts threaded through every codec call.
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
 * - Resolver: values already decoded that later sizes and payloads depend on
 * - Builder: creates the instances a codec returns
 * - ResolverContext: the scope a codec tree is built for
 *
 * Resolver and Builder are small value types whose copies share state, so a
 * deferred value can keep the exact context it was decoded with.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_RESOLVER_HPP
#define LAZYBITS_RESOLVER_HPP

#include "config.hpp"
#include "error.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <utility>

namespace lazybits {

/**
 * @brief Immutable chain of name to integer bindings.
 *
 * with() never modifies the resolver it is called on; it returns a new
 * resolver whose bindings shadow the existing ones.
 */
class Resolver {
public:
    Resolver() noexcept = default;

    /**
     * @brief Look up a binding.
     *
     * @param name Reference name
     * @return Bound value (innermost binding wins)
     * @throws UnresolvedReferenceException if name is not bound
     */
    [[nodiscard]] std::int64_t get(const std::string& name) const;

    /**
     * @brief Check whether a name is bound.
     */
    [[nodiscard]] bool contains(const std::string& name) const noexcept;

    /**
     * @brief Extend this resolver with one more binding.
     *
     * @param name Reference name
     * @param value Bound value
     * @return New resolver; this one is unchanged
     */
    [[nodiscard]] Resolver with(std::string name, std::int64_t value) const;

private:
    struct Binding;

    explicit Resolver(std::shared_ptr<const Binding> head) noexcept : head_(std::move(head)) {}

    std::shared_ptr<const Binding> head_;
};

/**
 * @brief Factory for decoded instances.
 *
 * Copies share one creation counter.
 */
class Builder {
public:
    Builder() : created_(std::make_shared<std::atomic<std::size_t>>(0)) {}

    /**
     * @brief Create a decoded instance.
     *
     * @tparam U Concrete type to create
     * @param args Constructor arguments
     * @return Newly created instance
     */
    template <typename U, typename... Args> std::shared_ptr<U> make(Args&&... args) const {
        auto instance = std::make_shared<U>(std::forward<Args>(args)...);
        created_->fetch_add(1, std::memory_order_relaxed);
        return instance;
    }

    /**
     * @brief Number of instances created through this builder and its copies.
     */
    [[nodiscard]] std::size_t created() const noexcept {
        return created_->load(std::memory_order_relaxed);
    }

private:
    std::shared_ptr<std::atomic<std::size_t>> created_;
};

/**
 * @brief Scope a codec tree is built for (e.g. "Packet.trailer").
 */
class ResolverContext {
public:
    ResolverContext() = default;
    explicit ResolverContext(std::string scope) : scope_(std::move(scope)) {}

    [[nodiscard]] const std::string& scope() const noexcept {
        return scope_;
    }

private:
    std::string scope_;
};

} // namespace lazybits

#endif // LAZYBITS_RESOLVER_HPP
