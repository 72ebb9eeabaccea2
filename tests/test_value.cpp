// tests/test_value.cpp
#include "tests.hpp"

#include "podcodec/pod/builder.hpp"
#include "podcodec/pod/value.hpp"

#include <cstdint>
#include <string_view>

using namespace podcodec::core;
using namespace podcodec::pod;
using namespace podcodec::tests;

namespace {

    template <typename Fn>
    byte_buffer build(Fn&& fn) {
        pod_builder builder;
        fn(builder);
        return builder.release();
    }
}

TEST_SUITE("pod/value") {

    TEST_CASE("scalars downcast to their own arm") {
        CHECK(std::get<bool>(downcast(encode(true))) == true);
        CHECK(std::get<id>(downcast(encode(id{ 7 }))) == id{ 7 });
        CHECK(std::get<std::int32_t>(downcast(encode(std::int32_t{ -3 }))) == -3);
        CHECK(std::get<std::int64_t>(downcast(encode(std::int64_t{ 1 } << 40))) == (std::int64_t{ 1 } << 40));
        CHECK(std::get<float>(downcast(encode(1.5f))) == 1.5f);
        CHECK(std::get<double>(downcast(encode(2.25))) == 2.25);
        CHECK(std::get<rectangle>(downcast(encode(rectangle{ 1920, 1080 }))) == rectangle{ 1920, 1080 });
        CHECK(std::get<fraction>(downcast(encode(fraction{ 25, 1 }))) == fraction{ 25, 1 });
        CHECK(std::get<fd>(downcast(encode(fd{ 3 }))) == fd{ 3 });

        const auto ptr = pointer{ to_tag(type::pointer_buffer), 0x1000 };
        CHECK(std::get<pointer>(downcast(encode(ptr))) == ptr);
    }

    TEST_CASE("none") {
        const auto bytes = build([](pod_builder& b) { b.add_none(); });
        CHECK(holds<none_value>(downcast(bytes)));
    }

    TEST_CASE("variable sized values") {
        SUBCASE("string") {
            const auto bytes = build([](pod_builder& b) { b.add("hi"); });
            const auto value = downcast(bytes);
            REQUIRE(holds<std::string_view>(value));
            CHECK(std::get<std::string_view>(value) == "hi");
        }
        SUBCASE("bytes") {
            const auto blob = from_u8({ 1, 2, 3 });
            const auto bytes = build([&](pod_builder& b) { b.add_bytes(blob); });
            const auto value = downcast(bytes);
            REQUIRE(holds<bytes_value>(value));
            CHECK(std::get<bytes_value>(value).data.size() == 3);
        }
        SUBCASE("bitmap") {
            const auto bits = from_u8({ 0xFF });
            const auto bytes = build([&](pod_builder& b) { b.add_bitmap(bits); });
            const auto value = downcast(bytes);
            REQUIRE(holds<bitmap_view>(value));
            CHECK(std::get<bitmap_view>(value).popcount() == 8);
        }
    }

    TEST_CASE("containers downcast to their views") {
        SUBCASE("array") {
            const auto bytes = build([](pod_builder& b) { b.add_array({ 1.0, 2.0 }); });
            const auto value = downcast(bytes);
            REQUIRE(holds<array_view<>>(value));
            CHECK(std::get<array_view<>>(value).child_type() == type::float64);
            CHECK(std::get<array_view<>>(value).size() == 2);
        }
        SUBCASE("struct") {
            const auto bytes = build([](pod_builder& b) {
                b.add_struct([](pod_builder& s) { s.add(true); s.add(false); });
            });
            const auto value = downcast(bytes);
            REQUIRE(holds<struct_view>(value));
            CHECK(std::get<struct_view>(value).size() == 2);
        }
        SUBCASE("object") {
            const auto bytes = build([](pod_builder& b) {
                b.add_object(type::object_param_io, 7, [](object_builder&) {});
            });
            const auto value = downcast(bytes);
            REQUIRE(holds<object_view>(value));
            CHECK(std::get<object_view>(value).body_type() == type::object_param_io);
            CHECK(std::get<object_view>(value).body_id() == 7);
        }
        SUBCASE("sequence") {
            const auto bytes = build([](pod_builder& b) { b.add_sequence(1, [](sequence_builder&) {}); });
            const auto value = downcast(bytes);
            REQUIRE(holds<sequence_view>(value));
            CHECK(std::get<sequence_view>(value).unit() == 1);
        }
        SUBCASE("choice") {
            const auto bytes = build([](pod_builder& b) {
                b.add_choice(choice_value<std::int32_t>::range(2, 1, 3));
            });
            const auto value = downcast(bytes);
            REQUIRE(holds<choice_view>(value));
            CHECK(std::get<choice_view>(value).kind() == choice_type::range);
            CHECK(std::get<choice_view>(value).value<std::int32_t>().default_value() == 2);
        }
    }

    TEST_CASE("pod tag is kept as a raw view") {
        const auto bytes = from_u8({ 4, 0, 0, 0, 20, 0, 0, 0, 1, 2, 3, 4 });
        const auto value = downcast(bytes);
        REQUIRE(holds<pod_view>(value));
        CHECK(std::get<pod_view>(value).payload().size() == 4);
    }

    TEST_CASE("unknown tag") {
        const auto bytes = from_u8({ 4, 0, 0, 0, 99, 0, 0, 0, 0, 0, 0, 0 });
        CHECK(error_of([&] { (void)downcast(bytes); }) == error_kind::unknown_pod_type_to_downcast);

        const auto object_tag = from_u8({ 0, 0, 0, 0, 1, 0, 4, 0 });
        CHECK(error_of([&] { (void)downcast(object_tag); }) == error_kind::unknown_pod_type_to_downcast);
    }

    TEST_CASE("downcast reports malformed payloads") {
        const auto bytes = from_u8({ 2, 0, 0, 0, 4, 0, 0, 0, 1, 0 });
        CHECK(error_of([&] { (void)downcast(bytes); }) == error_kind::data_too_short);
    }
}
