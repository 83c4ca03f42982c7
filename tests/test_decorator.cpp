/**
 * @file test_decorator.cpp
 * @brief Unit tests for LazyLoadingDecorator.
 */

#include <catch2/catch_test_macros.hpp>
#include <lazybits/lazy.hpp>

#include "fixtures.hpp"

using namespace lazybits;
using fixtures::Sample;
using fixtures::Uint32Codec;

static_assert(has_proxy_v<fixtures::Sample>);
static_assert(has_proxy_v<fixtures::Record>);
static_assert(!has_proxy_v<fixtures::PlainValue>);
static_assert(!has_proxy_v<fixtures::Unproxied>);
static_assert(!has_proxy_v<int>);

TEST_CASE("Decorator passes unmarked fields through", "[decorator]") {
    LazyLoadingDecorator decorator;
    ResolverContext context("Packet");
    CodecPtr<Sample> codec = std::make_shared<Uint32Codec>();

    SECTION("no metadata") {
        auto result = decorator.decorate(codec, nullptr, context);
        REQUIRE(result == codec);
    }

    SECTION("metadata without the marker") {
        FieldMetadata field("header");
        auto result = decorator.decorate(codec, &field, context);
        REQUIRE(result == codec);
    }

    SECTION("closed types are fine when not lazy") {
        CodecPtr<fixtures::PlainValue> plain = std::make_shared<fixtures::PlainCodec>();
        FieldMetadata field("raw");
        REQUIRE(decorator.decorate(plain, &field, context) == plain);
    }
}

TEST_CASE("Decorator wraps marked fields", "[decorator]") {
    LazyLoadingDecorator decorator;
    ResolverContext context("Packet");
    auto inner = std::make_shared<Uint32Codec>();
    CodecPtr<Sample> codec = inner;
    FieldMetadata field("trailer", {Annotation::LazyLoading});

    auto result = decorator.decorate(codec, &field, context);

    REQUIRE(result != codec);
    const auto* lazy = dynamic_cast<const LazyCodec<Sample>*>(result.get());
    REQUIRE(lazy != nullptr);
    REQUIRE(lazy->wrapped() == codec);
    REQUIRE(result->declared_type() == std::type_index(typeid(Sample)));

    SECTION("decorated codec decodes lazily") {
        std::uint8_t data[] = {0x00, 0x00, 0x00, 0x2A};
        BitBuffer buffer(data, 32);

        auto value = result->decode(buffer, Resolver(), Builder());
        REQUIRE(buffer.position() == 32);
        REQUIRE(inner->decodes.load() == 0);
        REQUIRE(value->value() == 42);
        REQUIRE(inner->decodes.load() == 1);
    }

    SECTION("each decoration builds a new wrapper") {
        auto again = decorator.decorate(codec, &field, context);
        REQUIRE(again != result);
    }
}

TEST_CASE("Decorator rejects lazy fields it cannot proxy", "[decorator][error]") {
    LazyLoadingDecorator decorator;
    ResolverContext context("Packet");
    FieldMetadata field("body", {Annotation::LazyLoading});

    SECTION("closed type without virtual members") {
        CodecPtr<fixtures::PlainValue> plain = std::make_shared<fixtures::PlainCodec>();
        REQUIRE_THROWS_AS(decorator.decorate(plain, &field, context), ConfigurationException);
    }

    SECTION("interface without a Proxy") {
        CodecPtr<fixtures::Unproxied> unproxied = std::make_shared<fixtures::UnproxiedCodec>();
        REQUIRE_THROWS_AS(decorator.decorate(unproxied, &field, context),
                          ConfigurationException);
    }
}

TEST_CASE("Decorator rejects a null codec only for lazy fields", "[decorator][error]") {
    LazyLoadingDecorator decorator;
    FieldMetadata lazy_field("body", {Annotation::LazyLoading});
    FieldMetadata eager_field("header");

    REQUIRE_THROWS_AS(decorator.decorate(CodecPtr<Sample>(), &lazy_field, ResolverContext()),
                      InvalidArgumentException);

    SECTION("unmarked fields pass a null codec through unchanged") {
        REQUIRE_NOTHROW(decorator.decorate(CodecPtr<Sample>(), nullptr, ResolverContext()));
        REQUIRE(decorator.decorate(CodecPtr<Sample>(), nullptr, ResolverContext()) == nullptr);
        REQUIRE(decorator.decorate(CodecPtr<Sample>(), &eager_field, ResolverContext()) ==
                nullptr);
    }
}
