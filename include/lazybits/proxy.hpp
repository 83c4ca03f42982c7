/**
 * @file proxy.hpp
 * @brief Placeholders standing in for values that are not decoded yet.
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
 * A lazily decoded value of interface type T is returned as a Proxy<T>: an
 * object implementing T whose every member forwards to the value held by a
 * DeferredValue<T>. The first forwarded call triggers the decode.
 *
 * Proxy<T> is declared here and specialized once per interface, before any
 * codec for T is made lazy:
 *
 * @code
 * namespace lazybits {
 * template <> class Proxy<Header> final : public Header, public ProxyBase<Header> {
 * public:
 *     using ProxyBase::ProxyBase;
 *     std::uint16_t length() const override { return forward(&Header::length); }
 *     bool flag(int index) const override { return forward(&Header::flag, index); }
 * };
 * } // namespace lazybits
 * @endcode
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_PROXY_HPP
#define LAZYBITS_PROXY_HPP

#include "deferred.hpp"

#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace lazybits {

/**
 * @brief Placeholder for a deferred value of type T.
 *
 * Not defined; specialize for each interface that may be decoded lazily.
 */
template <typename T> class Proxy;

/**
 * @brief Shared part of every Proxy<T> specialization.
 *
 * @tparam T Interface the proxy implements
 */
template <typename T> class ProxyBase {
public:
    explicit ProxyBase(std::shared_ptr<DeferredValue<T>> handle) noexcept
        : handle_(std::move(handle)) {}

    /**
     * @brief Deferred value behind this proxy.
     */
    [[nodiscard]] const std::shared_ptr<DeferredValue<T>>& handle() const noexcept {
        return handle_;
    }

protected:
    ~ProxyBase() = default;

    /**
     * @brief Decoded value, decoding it if this is the first access.
     */
    T& target() const {
        return handle_->get();
    }

    /**
     * @brief Route a member call to the decoded value.
     *
     * @param member Pointer to a member of T
     * @param args Arguments for the call
     * @return Whatever the member returns on the decoded value
     */
    template <typename Member, typename... Args>
    decltype(auto) forward(Member member, Args&&... args) const {
        return std::invoke(member, target(), std::forward<Args>(args)...);
    }

private:
    std::shared_ptr<DeferredValue<T>> handle_;
};

/**
 * @brief Whether T can be decoded lazily.
 *
 * True when T is polymorphic and Proxy<T> is a complete type implementing T
 * that can be built from a DeferredValue<T>.
 */
template <typename T, typename = void> struct has_proxy : std::false_type {};

template <typename T>
struct has_proxy<T, std::void_t<decltype(sizeof(Proxy<T>))>>
    : std::bool_constant<std::is_polymorphic_v<T> && std::is_base_of_v<T, Proxy<T>> &&
                         std::is_base_of_v<ProxyBase<T>, Proxy<T>> &&
                         std::is_constructible_v<Proxy<T>, std::shared_ptr<DeferredValue<T>>>> {};

template <typename T> inline constexpr bool has_proxy_v = has_proxy<T>::value;

/**
 * @brief Whether value is a placeholder for a deferred value.
 */
template <typename T> bool is_deferred(const T& value) noexcept {
    return dynamic_cast<const ProxyBase<T>*>(&value) != nullptr;
}

/**
 * @brief Whether value can be used without triggering a decode.
 *
 * Eagerly decoded values are always resolved.
 */
template <typename T> bool is_resolved(const T& value) noexcept {
    const auto* proxy = dynamic_cast<const ProxyBase<T>*>(&value);
    return proxy == nullptr || proxy->handle()->resolved();
}

} // namespace lazybits

#endif // LAZYBITS_PROXY_HPP
