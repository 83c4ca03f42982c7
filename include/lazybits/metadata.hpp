/**
 * @file metadata.hpp
 * @brief Per-field declaration metadata.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_METADATA_HPP
#define LAZYBITS_METADATA_HPP

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace lazybits {

/**
 * @brief Markers a field declaration can carry.
 */
enum class Annotation {
    LazyLoading ///< Decode the field only when it is first accessed
};

/**
 * @brief Name and markers of one field declaration.
 */
class FieldMetadata {
public:
    explicit FieldMetadata(std::string name, std::initializer_list<Annotation> annotations = {})
        : name_(std::move(name)), annotations_(annotations) {}

    [[nodiscard]] const std::string& name() const noexcept {
        return name_;
    }

    [[nodiscard]] bool has(Annotation annotation) const noexcept;

    [[nodiscard]] bool lazy_loading() const noexcept {
        return has(Annotation::LazyLoading);
    }

private:
    std::string name_;
    std::vector<Annotation> annotations_;
};

} // namespace lazybits

#endif // LAZYBITS_METADATA_HPP
