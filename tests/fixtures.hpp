/**
 * @file fixtures.hpp
 * @brief Value interfaces, proxies and instrumented codecs shared by tests.
 */

#ifndef LAZYBITS_TESTS_FIXTURES_HPP
#define LAZYBITS_TESTS_FIXTURES_HPP

#include <lazybits/lazybits.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <typeindex>
#include <utility>
#include <vector>

namespace fixtures {

// ============================================================================
// Sample: a single 32-bit big-endian unsigned integer
// ============================================================================

class Sample {
public:
    virtual ~Sample() = default;
    virtual std::uint32_t value() const = 0;
    virtual bool is_negative() const = 0;
    virtual std::uint32_t masked(std::uint32_t mask) const = 0;
};

class Uint32Sample final : public Sample {
public:
    explicit Uint32Sample(std::uint32_t value) : value_(value) {}

    std::uint32_t value() const override {
        return value_;
    }

    bool is_negative() const override {
        return (value_ & 0x80000000U) != 0;
    }

    std::uint32_t masked(std::uint32_t mask) const override {
        return value_ & mask;
    }

private:
    std::uint32_t value_;
};

/**
 * @brief Reads a Uint32Sample and counts how often it was asked to.
 */
class Uint32Codec final : public lazybits::Codec<Sample> {
public:
    std::shared_ptr<Sample> decode(lazybits::BitBuffer& buffer, const lazybits::Resolver&,
                                   const lazybits::Builder& builder) const override {
        ++decodes;
        return builder.make<Uint32Sample>(buffer.read_bits(32));
    }

    std::size_t size(const lazybits::Resolver&) const override {
        ++sizes;
        return 32;
    }

    lazybits::CodecDescriptor describe() const override {
        return {"uint32", "32-bit big-endian unsigned integer"};
    }

    std::vector<std::type_index> related_types() const override {
        return {typeid(Uint32Sample)};
    }

    mutable std::atomic<int> decodes{0};
    mutable std::atomic<int> sizes{0};
};

// ============================================================================
// Record: one kind byte followed by a payload whose length is resolved
// from the "record.length" binding
// ============================================================================

class Record {
public:
    virtual ~Record() = default;
    virtual std::uint8_t kind() const = 0;
    virtual std::size_t length() const = 0;
    virtual std::uint8_t byte_at(std::size_t index) const = 0;
    virtual std::uint32_t checksum() const = 0;
    virtual std::string label() const = 0;
};

class BytesRecord final : public Record {
public:
    BytesRecord(std::uint8_t kind, std::vector<std::uint8_t> payload)
        : kind_(kind), payload_(std::move(payload)) {}

    std::uint8_t kind() const override {
        return kind_;
    }

    std::size_t length() const override {
        return payload_.size();
    }

    std::uint8_t byte_at(std::size_t index) const override {
        return payload_.at(index);
    }

    std::uint32_t checksum() const override {
        std::uint32_t sum = kind_;
        for (std::uint8_t b : payload_) {
            sum = (sum * 31U) + b;
        }
        return sum;
    }

    std::string label() const override {
        return "record-" + std::to_string(kind_) + "/" + std::to_string(payload_.size());
    }

private:
    std::uint8_t kind_;
    std::vector<std::uint8_t> payload_;
};

class RecordCodec final : public lazybits::Codec<Record> {
public:
    std::shared_ptr<Record> decode(lazybits::BitBuffer& buffer, const lazybits::Resolver& resolver,
                                   const lazybits::Builder& builder) const override {
        ++decodes;
        const std::size_t length = payload_length(resolver);
        auto kind = static_cast<std::uint8_t>(buffer.read_bits(8));
        std::vector<std::uint8_t> payload;
        payload.reserve(length);
        for (std::size_t i = 0; i < length; ++i) {
            payload.push_back(static_cast<std::uint8_t>(buffer.read_bits(8)));
        }
        return builder.make<BytesRecord>(kind, std::move(payload));
    }

    std::size_t size(const lazybits::Resolver& resolver) const override {
        return 8 + (8 * payload_length(resolver));
    }

    lazybits::CodecDescriptor describe() const override {
        return {"record", "kind byte followed by record.length payload bytes"};
    }

    mutable std::atomic<int> decodes{0};

private:
    static std::size_t payload_length(const lazybits::Resolver& resolver) {
        if (!resolver.contains("record.length")) {
            throw lazybits::SizeResolutionException("record.length is not bound");
        }
        return static_cast<std::size_t>(resolver.get("record.length"));
    }
};

// ============================================================================
// Misbehaving codecs
// ============================================================================

/**
 * @brief Reads 8 of its 16 bits, then reports corrupt data.
 *
 * Succeeds from the (failures + 1)th decode on.
 */
class FlakyCodec final : public lazybits::Codec<Sample> {
public:
    explicit FlakyCodec(int failures = 1 << 30) : failures_(failures) {}

    std::shared_ptr<Sample> decode(lazybits::BitBuffer& buffer, const lazybits::Resolver&,
                                   const lazybits::Builder& builder) const override {
        int attempt = ++decodes;
        std::uint32_t high = buffer.read_bits(8);
        if (attempt <= failures_) {
            throw lazybits::InvalidDataException("corrupt sample");
        }
        return builder.make<Uint32Sample>((high << 8) | buffer.read_bits(8));
    }

    std::size_t size(const lazybits::Resolver&) const override {
        return 16;
    }

    lazybits::CodecDescriptor describe() const override {
        return {"flaky", ""};
    }

    mutable std::atomic<int> decodes{0};

private:
    int failures_;
};

class NullCodec final : public lazybits::Codec<Sample> {
public:
    std::shared_ptr<Sample> decode(lazybits::BitBuffer& buffer, const lazybits::Resolver&,
                                   const lazybits::Builder&) const override {
        buffer.skip(8);
        return nullptr;
    }

    std::size_t size(const lazybits::Resolver&) const override {
        return 8;
    }

    lazybits::CodecDescriptor describe() const override {
        return {"null", ""};
    }
};

// ============================================================================
// Types that cannot be decoded lazily
// ============================================================================

/// Closed type with no virtual members
struct PlainValue {
    std::uint32_t raw;
};

class PlainCodec final : public lazybits::Codec<PlainValue> {
public:
    std::shared_ptr<PlainValue> decode(lazybits::BitBuffer& buffer, const lazybits::Resolver&,
                                       const lazybits::Builder& builder) const override {
        return builder.make<PlainValue>(PlainValue{buffer.read_bits(32)});
    }

    std::size_t size(const lazybits::Resolver&) const override {
        return 32;
    }

    lazybits::CodecDescriptor describe() const override {
        return {"plain", ""};
    }
};

/// Interface nobody wrote a Proxy for
class Unproxied {
public:
    virtual ~Unproxied() = default;
    virtual int answer() const = 0;
};

class UnproxiedCodec final : public lazybits::Codec<Unproxied> {
public:
    std::shared_ptr<Unproxied> decode(lazybits::BitBuffer&, const lazybits::Resolver&,
                                      const lazybits::Builder&) const override {
        throw lazybits::InvalidDataException("not used");
    }

    std::size_t size(const lazybits::Resolver&) const override {
        return 0;
    }

    lazybits::CodecDescriptor describe() const override {
        return {"unproxied", ""};
    }
};

} // namespace fixtures

namespace lazybits {

template <> class Proxy<fixtures::Sample> final : public fixtures::Sample,
                                                  public ProxyBase<fixtures::Sample> {
public:
    using ProxyBase::ProxyBase;

    std::uint32_t value() const override {
        return forward(&fixtures::Sample::value);
    }

    bool is_negative() const override {
        return forward(&fixtures::Sample::is_negative);
    }

    std::uint32_t masked(std::uint32_t mask) const override {
        return forward(&fixtures::Sample::masked, mask);
    }
};

template <> class Proxy<fixtures::Record> final : public fixtures::Record,
                                                  public ProxyBase<fixtures::Record> {
public:
    using ProxyBase::ProxyBase;

    std::uint8_t kind() const override {
        return forward(&fixtures::Record::kind);
    }

    std::size_t length() const override {
        return forward(&fixtures::Record::length);
    }

    std::uint8_t byte_at(std::size_t index) const override {
        return forward(&fixtures::Record::byte_at, index);
    }

    std::uint32_t checksum() const override {
        return forward(&fixtures::Record::checksum);
    }

    std::string label() const override {
        return forward(&fixtures::Record::label);
    }
};

} // namespace lazybits

#endif // LAZYBITS_TESTS_FIXTURES_HPP
