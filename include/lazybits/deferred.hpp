/**
 * @file deferred.hpp
 * @brief Deferred value: a decode postponed until first access.
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
 * A DeferredValue remembers where in a buffer a value starts and everything
 * needed to decode it. The first get() seeks the shared buffer cursor to
 * that position, runs the real decode, and puts the cursor back where the
 * caller left it. The result is cached; later calls never touch the buffer.
 *
 * @par States
 * @verbatim
 *   Pending --get() ok-----> Resolved
 *      |
 *      +----get() throws---> Failed     (LAZYBITS_RETRY_FAILED_RESOLVE=0)
 *      +----get() throws---> Pending    (LAZYBITS_RETRY_FAILED_RESOLVE=1)
 * @endverbatim
 * A Failed value rethrows the exception of its failed decode from every get().
 *
 * @par Thread safety
 * The buffer must only be used by one decode traversal at a time. With
 * LAZYBITS_SERIALIZE_FIRST_USE=1, concurrent first access to the same
 * DeferredValue is serialized and decodes once. Concurrent use of the buffer
 * by anything else is still the caller's responsibility.
 *
 * @authors Georges Labreche <georges@tanagraspace.com>
 */

#ifndef LAZYBITS_DEFERRED_HPP
#define LAZYBITS_DEFERRED_HPP

#include "bitbuffer.hpp"
#include "codec.hpp"
#include "config.hpp"
#include "error.hpp"
#include "log.hpp"
#include "resolver.hpp"

#include <atomic>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <variant>

namespace lazybits {

/**
 * @brief Value of type T decoded on first access.
 *
 * @tparam T Declared value type
 */
template <typename T> class DeferredValue {
public:
    /**
     * @brief Capture a pending decode. Does not call the codec.
     *
     * @param codec Codec that performs the real decode
     * @param buffer Buffer the value lives in (not owned)
     * @param saved_position Bit position the value starts at
     * @param resolver Resolver to decode with
     * @param builder Builder to decode with
     */
    DeferredValue(CodecPtr<T> codec, BitBuffer& buffer, std::size_t saved_position,
                  Resolver resolver, Builder builder)
        : state_(Pending{std::move(codec), &buffer, std::move(resolver), std::move(builder)}),
          saved_position_(saved_position), phase_(Phase::Pending) {}

    DeferredValue(const DeferredValue&) = delete;
    DeferredValue& operator=(const DeferredValue&) = delete;

    /**
     * @brief Get the value, decoding it on first call.
     *
     * @return Decoded value
     * @throws Whatever the wrapped codec throws, on the call that decodes
     *         and (when poisoned) on every later call
     */
    T& get() {
        if (phase_.load(std::memory_order_acquire) == Phase::Resolved) [[likely]] {
            return *std::get<Resolved>(state_).value;
        }
        if constexpr (SERIALIZE_FIRST_USE) {
            std::lock_guard<std::mutex> lock(mutex_);
            return resolve();
        } else {
            return resolve();
        }
    }

    /**
     * @brief Whether the real decode has completed.
     */
    [[nodiscard]] bool resolved() const noexcept {
        return phase_.load(std::memory_order_acquire) == Phase::Resolved;
    }

    /**
     * @brief Whether a failed decode poisoned this value.
     */
    [[nodiscard]] bool poisoned() const noexcept {
        return phase_.load(std::memory_order_acquire) == Phase::Failed;
    }

    /**
     * @brief Bit position the value starts at.
     */
    [[nodiscard]] std::size_t saved_position() const noexcept {
        return saved_position_;
    }

private:
    enum class Phase { Pending, Resolved, Failed };

    struct Pending {
        CodecPtr<T> codec;
        BitBuffer* buffer;
        Resolver resolver;
        Builder builder;
    };

    struct Resolved {
        std::shared_ptr<T> value;
    };

    struct Failed {
        std::exception_ptr error;
    };

    std::variant<Pending, Resolved, Failed> state_;
    std::size_t saved_position_;
    std::atomic<Phase> phase_;
    std::mutex mutex_;

    T& resolve() {
        // Another caller may have finished while we waited for the lock
        if (auto* resolved = std::get_if<Resolved>(&state_)) {
            return *resolved->value;
        }
        if (auto* failed = std::get_if<Failed>(&state_)) {
            std::rethrow_exception(failed->error);
        }

        Pending& pending = std::get<Pending>(state_);
        BitBuffer& buffer = *pending.buffer;
        const std::size_t caller_position = buffer.position();

        std::shared_ptr<T> value;
        try {
            buffer.set_position(saved_position_);
            value = pending.codec->decode(buffer, pending.resolver, pending.builder);
            if (!value) {
                throw InvalidDataException("Codec '" + pending.codec->describe().title +
                                           "' produced no value at bit " +
                                           std::to_string(saved_position_));
            }
        } catch (...) {
            buffer.set_position(caller_position);
            record_failure(std::current_exception());
            throw;
        }
        buffer.set_position(caller_position);

        logger()->debug("Resolved deferred value at bit {} (cursor kept at {})", saved_position_,
                        caller_position);

        // Drops the codec and context references along with Pending
        state_ = Resolved{std::move(value)};
        phase_.store(Phase::Resolved, std::memory_order_release);
        return *std::get<Resolved>(state_).value;
    }

    void record_failure([[maybe_unused]] std::exception_ptr error) {
        if constexpr (RETRY_FAILED_RESOLVE) {
            logger()->warn("Deferred value at bit {} failed to decode; will retry on next access",
                           saved_position_);
        } else {
            logger()->warn("Deferred value at bit {} failed to decode; value poisoned",
                           saved_position_);
            state_ = Failed{std::move(error)};
            phase_.store(Phase::Failed, std::memory_order_release);
        }
    }
};

} // namespace lazybits

#endif // LAZYBITS_DEFERRED_HPP
