/**
 * @file bitbuffer.hpp
 * @brief Bit-addressable read buffer with a settable cursor.
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
 * The bit buffer provides stateful bit-level access to encoded data,
 * reading MSB-first within each byte. Every codec decoding from the same
 * buffer shares its cursor.
 *
 * @par Thread safety
 * None. A BitBuffer must be used by one decode traversal at a time.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_BITBUFFER_HPP
#define LAZYBITS_BITBUFFER_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>

namespace lazybits {

/**
 * @brief Sequential bit reader with random cursor access.
 *
 * Does not own the bytes it reads; they must outlive the buffer and every
 * deferred value decoded from it.
 */
class BitBuffer {
public:
    /**
     * @brief Construct a bit buffer.
     *
     * @param data Pointer to source data buffer
     * @param num_bits Number of valid bits in buffer
     */
    BitBuffer(const std::uint8_t* data, std::size_t num_bits) noexcept
        : data_(data), num_bits_(num_bits), bit_pos_(0) {}

    /**
     * @brief Read a single bit.
     *
     * @return Bit value (0 or 1)
     * @throws UnderflowException if no bits remain
     */
    inline int read_bit() {
        if (bit_pos_ >= num_bits_) [[unlikely]] {
            throw UnderflowException("Read past end of buffer at bit " + std::to_string(bit_pos_));
        }

        std::size_t byte_idx = bit_pos_ >> 3; // bit_pos_ / 8
        std::size_t bit_idx = bit_pos_ & 7;   // bit_pos_ % 8

        // MSB-first: bit 0 of byte is at position 7
        int bit = (data_[byte_idx] >> (7 - bit_idx)) & 1;
        ++bit_pos_;

        return bit;
    }

    /**
     * @brief Read up to 32 bits MSB-first as an unsigned value.
     *
     * @param num_bits Number of bits to read (1-32)
     * @return Unsigned value from bits read
     * @throws InvalidArgumentException if num_bits is out of range
     * @throws UnderflowException if fewer than num_bits remain
     */
    std::uint32_t read_bits(std::size_t num_bits) {
        if (num_bits == 0 || num_bits > 32) [[unlikely]] {
            throw InvalidArgumentException("read_bits width must be 1-32, got " +
                                           std::to_string(num_bits));
        }
        return static_cast<std::uint32_t>(read_value(num_bits));
    }

    /**
     * @brief Read up to MAX_READ_BITS bits MSB-first as an unsigned value.
     *
     * @param num_bits Number of bits to read (1-64)
     * @return Unsigned value from bits read
     */
    std::uint64_t read_bits64(std::size_t num_bits) {
        if (num_bits == 0 || num_bits > MAX_READ_BITS) [[unlikely]] {
            throw InvalidArgumentException("read_bits64 width must be 1-" +
                                           std::to_string(MAX_READ_BITS) + ", got " +
                                           std::to_string(num_bits));
        }
        return read_value(num_bits);
    }

    /**
     * @brief Get current bit position.
     *
     * @return Number of bits before the cursor
     */
    [[nodiscard]] std::size_t position() const noexcept {
        return bit_pos_;
    }

    /**
     * @brief Move the cursor.
     *
     * The cursor may be placed anywhere from 0 to size() inclusive.
     *
     * @param bit_pos New cursor position in bits
     * @throws OverflowException if bit_pos exceeds size(); cursor unchanged
     */
    void set_position(std::size_t bit_pos) {
        if (bit_pos > num_bits_) [[unlikely]] {
            throw OverflowException("Cursor " + std::to_string(bit_pos) +
                                    " beyond end of buffer (" + std::to_string(num_bits_) +
                                    " bits)");
        }
        bit_pos_ = bit_pos;
    }

    /**
     * @brief Advance the cursor without reading.
     *
     * @param num_bits Number of bits to skip
     * @throws OverflowException if fewer than num_bits remain; cursor unchanged
     */
    void skip(std::size_t num_bits) {
        if (num_bits > remaining()) [[unlikely]] {
            throw OverflowException("Cannot skip " + std::to_string(num_bits) + " bits at " +
                                    std::to_string(bit_pos_) + ", only " +
                                    std::to_string(remaining()) + " remain");
        }
        bit_pos_ += num_bits;
    }

    /**
     * @brief Get remaining bits.
     *
     * @return Number of bits remaining to read
     */
    [[nodiscard]] std::size_t remaining() const noexcept {
        return (bit_pos_ < num_bits_) ? (num_bits_ - bit_pos_) : 0;
    }

    /**
     * @brief Get the number of valid bits in the buffer.
     */
    [[nodiscard]] std::size_t size() const noexcept {
        return num_bits_;
    }

    /**
     * @brief Skip to next byte boundary.
     *
     * Advances position to start of next byte (for padding). Never moves
     * the cursor past size().
     */
    void align_byte() noexcept {
        std::size_t bit_offset = bit_pos_ & 7; // bit_pos_ % 8
        if (bit_offset != 0) {
            bit_pos_ += (8 - bit_offset);
            if (bit_pos_ > num_bits_) {
                bit_pos_ = num_bits_;
            }
        }
    }

private:
    const std::uint8_t* data_;
    std::size_t num_bits_;
    std::size_t bit_pos_;

    std::uint64_t read_value(std::size_t num_bits) {
        if (num_bits > remaining()) [[unlikely]] {
            throw UnderflowException("Cannot read " + std::to_string(num_bits) + " bits at " +
                                     std::to_string(bit_pos_) + ", only " +
                                     std::to_string(remaining()) + " remain");
        }

        // Fast path: byte-aligned reads (common case)
        if ((bit_pos_ & 7) == 0 && (num_bits & 7) == 0) [[likely]] {
            std::size_t byte_idx = bit_pos_ >> 3;
            std::size_t num_bytes = num_bits >> 3;
            std::uint64_t value = 0;
            for (std::size_t i = 0; i < num_bytes; ++i) {
                value = (value << 8) | data_[byte_idx + i];
            }
            bit_pos_ += num_bits;
            return value;
        }

        // General case: unaligned reads
        std::uint64_t value = 0;
        std::size_t remaining_bits = num_bits;

        while (remaining_bits > 0) {
            std::size_t byte_idx = bit_pos_ >> 3;
            std::size_t bit_idx = bit_pos_ & 7;

            // Bits available in current byte
            std::size_t bits_in_byte = 8 - bit_idx;
            std::size_t bits_to_read =
                (remaining_bits < bits_in_byte) ? remaining_bits : bits_in_byte;

            // Extract bits from current byte (MSB-first)
            std::uint8_t byte_val = data_[byte_idx];
            std::uint32_t shift = static_cast<std::uint32_t>(8 - bit_idx - bits_to_read);
            std::uint32_t mask = (1U << bits_to_read) - 1U;
            std::uint64_t extracted = (byte_val >> shift) & mask;

            value = (value << bits_to_read) | extracted;
            bit_pos_ += bits_to_read;
            remaining_bits -= bits_to_read;
        }

        return value;
    }
};

} // namespace lazybits

#endif // LAZYBITS_BITBUFFER_HPP
