/**
 * @file resolver.cpp
 * @brief Resolver binding chain.
 *
 * Bindings form a singly linked list shared between resolvers; extending a
 * resolver allocates one node and never copies the rest of the chain.
 */

#include <lazybits/resolver.hpp>

namespace lazybits {

struct Resolver::Binding {
    std::string name;
    std::int64_t value;
    std::shared_ptr<const Binding> next;
};

std::int64_t Resolver::get(const std::string& name) const {
    for (const Binding* node = head_.get(); node != nullptr; node = node->next.get()) {
        if (node->name == name) {
            return node->value;
        }
    }
    throw UnresolvedReferenceException(name);
}

bool Resolver::contains(const std::string& name) const noexcept {
    for (const Binding* node = head_.get(); node != nullptr; node = node->next.get()) {
        if (node->name == name) {
            return true;
        }
    }
    return false;
}

Resolver Resolver::with(std::string name, std::int64_t value) const {
    return Resolver(std::make_shared<Binding>(Binding{std::move(name), value, head_}));
}

} // namespace lazybits
