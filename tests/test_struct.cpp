// tests/test_struct.cpp
#include "tests.hpp"

#include "podcodec/pod/builder.hpp"
#include "podcodec/pod/struct.hpp"

#include <cstdint>

using namespace podcodec::core;
using namespace podcodec::pod;
using namespace podcodec::tests;

TEST_SUITE("pod/struct") {

    TEST_CASE("members are read back in order") {
        pod_builder builder;
        builder.add_struct([](pod_builder& b) {
            b.add(std::int32_t{ 1 });
            b.add("x");
            b.add_struct([](pod_builder& inner) {
                inner.add(2.5);
            });
        });

        const auto root = builder.root();
        CHECK(root.type() == type::structure);
        CHECK(root.size() == 56);

        const auto st = struct_view::parse(root);
        CHECK(st.size() == 3);
        CHECK(st.at(0).get<std::int32_t>() == 1);
        CHECK(st.at(1).get_string() == "x");

        const auto inner = struct_view::parse(st.at(2));
        CHECK(inner.size() == 1);
        CHECK(inner.at(0).get<double>() == 2.5);
    }

    TEST_CASE("iteration visits every member once") {
        pod_builder builder;
        builder.add_struct([](pod_builder& b) {
            b.add(std::int64_t{ 10 });
            b.add(id{ 20 });
            b.add_none();
            b.add(fraction{ 30, 1 });
        });

        std::vector<type> seen;
        for (const auto& member : struct_view::parse(builder.root())) {
            seen.push_back(member.type());
        }
        CHECK(seen == std::vector<type>{ type::int64, type::id, type::none, type::fraction });
    }

    TEST_CASE("members start on aligned offsets") {
        pod_builder builder;
        builder.add_struct([](pod_builder& b) {
            b.add(true);
            b.add("abc");
            b.add(std::int32_t{ 7 });
        });

        const auto st = struct_view::parse(builder.root());
        const auto base = st.members().data();
        for (const auto& member : st) {
            CHECK((member.bytes().data() - base) % pod_align == 0);
        }
        CHECK(st.at(2).get<std::int32_t>() == 7);
    }

    TEST_CASE("empty struct") {
        pod_builder builder;
        builder.add_struct([](pod_builder&) {});
        const auto st = struct_view::parse(builder.root());
        CHECK(builder.root().size() == 0);
        CHECK(st.size() == 0);
        CHECK(st.begin() == st.end());
        CHECK(error_of([&] { (void)st.at(0); }) == error_kind::index_is_out_of_range);
    }

    TEST_CASE("member claiming more bytes than remain") {
        // Struct size 16 holding an Int that claims 12 payload bytes
        const auto bytes = from_u8({
            16, 0, 0, 0,  14, 0, 0, 0,
            12, 0, 0, 0,  4, 0, 0, 0,
            1, 0, 0, 0,   0, 0, 0, 0 });
        const auto st = struct_view::parse(pod_view::parse(bytes));
        CHECK(error_of([&] { (void)st.to_vector(); }) == error_kind::data_too_short);
    }

    TEST_CASE("struct header larger than the buffer") {
        const auto bytes = from_u8({ 32, 0, 0, 0, 14, 0, 0, 0, 4, 0, 0, 0, 4, 0, 0, 0 });
        CHECK(error_of([&] { (void)pod_view::parse(bytes); }) == error_kind::data_too_short);
    }

    TEST_CASE("not a struct") {
        pod_builder builder;
        builder.add(1.0f);
        CHECK(error_of([&] { (void)struct_view::parse(builder.root()); }) == error_kind::wrong_pod_type_to_cast);
    }
}
