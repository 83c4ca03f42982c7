/**
 * @file descriptor.cpp
 * @brief CodecDescriptor formatting.
 */

#include <lazybits/descriptor.hpp>

#include <fmt/format.h>

namespace lazybits {

std::string CodecDescriptor::to_string() const {
    if (details.empty()) {
        return title;
    }
    return fmt::format("{}: {}", title, details);
}

} // namespace lazybits
