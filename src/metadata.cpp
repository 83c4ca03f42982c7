/**
 * @file metadata.cpp
 * @brief FieldMetadata lookup.
 */

#include <lazybits/metadata.hpp>

#include <algorithm>

namespace lazybits {

bool FieldMetadata::has(Annotation annotation) const noexcept {
    return std::find(annotations_.begin(), annotations_.end(), annotation) != annotations_.end();
}

} // namespace lazybits
