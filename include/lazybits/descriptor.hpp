/**
 * @file descriptor.hpp
 * @brief Human-readable codec descriptions.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_DESCRIPTOR_HPP
#define LAZYBITS_DESCRIPTOR_HPP

#include <string>

namespace lazybits {

/**
 * @brief Describes what a codec reads, for documentation and diagnostics.
 */
struct CodecDescriptor {
    std::string title;   ///< Short name, e.g. "uint32"
    std::string details; ///< Layout description, e.g. "32-bit big-endian unsigned integer"

    /**
     * @brief Format as "title: details", or just the title when there are no details.
     */
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const CodecDescriptor&, const CodecDescriptor&) = default;
};

} // namespace lazybits

#endif // LAZYBITS_DESCRIPTOR_HPP
