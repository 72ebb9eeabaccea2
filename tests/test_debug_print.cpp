// tests/test_debug_print.cpp
#include "tests.hpp"

#include "podcodec/pod/builder.hpp"
#include "podcodec/pod/debug_print.hpp"
#include "podcodec/param/media.hpp"

#include <cstdint>
#include <sstream>
#include <string>

using namespace podcodec::core;
using namespace podcodec::pod;
using namespace podcodec::tests;

namespace param = podcodec::param;

namespace {

    std::string dump(byte_view bytes, const settings& sett = {}) {
        std::ostringstream oss;
        debug_print(oss, bytes, sett);
        return oss.str();
    }

    bool contains(const std::string& text, std::string_view needle) {
        return text.find(needle) != std::string::npos;
    }
}

TEST_SUITE("pod/debug_print") {

    TEST_CASE("scalars") {
        CHECK(dump(encode(std::int32_t{ 5 })) == "Int: 5\n");
        CHECK(dump(encode(true)) == "Bool: true\n");
        CHECK(dump(encode(rectangle{ 640, 480 })) == "Rectangle: 640x480\n");
    }

    TEST_CASE("stream operator prints the tree") {
        pod_builder builder;
        builder.add("text");
        std::ostringstream oss;
        oss << builder.root();
        CHECK(oss.str() == "String: \"text\"\n");
    }

    TEST_CASE("containers are indented") {
        pod_builder builder;
        builder.add_object(type::object_format, static_cast<std::uint32_t>(param::param_type::enum_format),
            [](object_builder& obj) {
                obj.add(param::format_key::media_type, param::to_id(param::media_type::audio));
                obj.add_choice(param::format_key::audio_rate, choice_value<std::int32_t>::enumeration(5, { 1, 2 }));
            });
        const auto text = dump(builder.view());

        CHECK(contains(text, "Object type=Format id=3:\n"));
        CHECK(contains(text, "  key=1 flags=0\n"));
        CHECK(contains(text, "    Id: Id(1)\n"));
        CHECK(contains(text, "    Choice Enum flags=0 child=Int:\n"));
        CHECK(contains(text, "      [0] 5\n"));
        CHECK(contains(text, "      [2] 2\n"));
    }

    TEST_CASE("arrays and sequences") {
        pod_builder array;
        array.add_array({ std::int32_t{ 1 }, std::int32_t{ 2 } });
        const auto array_text = dump(array.view());
        CHECK(contains(array_text, "Array child=Int count=2:\n"));
        CHECK(contains(array_text, "  [1] 2\n"));

        const auto data = from_u8({ 0x90 });
        pod_builder seq;
        seq.add_sequence(0, [&](sequence_builder& s) { s.add_midi(12, data); });
        const auto seq_text = dump(seq.view());
        CHECK(contains(seq_text, "Sequence unit=0:\n"));
        CHECK(contains(seq_text, "  offset=12 type=2\n"));
        CHECK(contains(seq_text, "    Bytes: 1 bytes\n"));
    }

    TEST_CASE("unknown tags are named by number") {
        const auto bytes = from_u8({ 4, 0, 0, 0, 99, 0, 0, 0, 0, 0, 0, 0 });
        CHECK(dump(bytes) == "UNKNOWN(99) size=4\n");
    }

    TEST_CASE("malformed input is reported inline") {
        SUBCASE("string without terminator") {
            const auto bytes = from_u8({ 3, 0, 0, 0, 8, 0, 0, 0, 'a', 'b', 'c', 0 });
            const auto text = dump(bytes);
            CHECK(contains(text, "<error: "));
        }
        SUBCASE("truncated header") {
            const auto bytes = from_u8({ 3, 0, 0 });
            CHECK(contains(dump(bytes), "<error: "));
        }
        SUBCASE("bad member inside a struct") {
            const auto bytes = from_u8({
                16, 0, 0, 0,  14, 0, 0, 0,
                12, 0, 0, 0,  4, 0, 0, 0,
                1, 0, 0, 0,   0, 0, 0, 0 });
            const auto text = dump(bytes);
            CHECK(contains(text, "Struct:\n"));
            CHECK(contains(text, "<error: "));
        }
    }

    TEST_CASE("limits from settings") {
        SUBCASE("depth") {
            pod_builder builder;
            builder.add_struct([](pod_builder& b) {
                b.add_struct([](pod_builder& inner) { inner.add(std::int32_t{ 1 }); });
            });
            settings sett;
            sett.debug_max_depth = 2;
            const auto text = dump(builder.view(), sett);
            CHECK(contains(text, "..."));
            CHECK_FALSE(contains(text, "Int: 1"));
        }
        SUBCASE("element count") {
            pod_builder builder;
            builder.add_array({ std::int32_t{ 1 }, std::int32_t{ 2 }, std::int32_t{ 3 }, std::int32_t{ 4 }, std::int32_t{ 5 } });
            settings sett;
            sett.debug_max_elements = 2;
            const auto text = dump(builder.view(), sett);
            CHECK(contains(text, "  [1] 2\n"));
            CHECK(contains(text, "... 3 more\n"));
            CHECK_FALSE(contains(text, "[2]"));
        }
        SUBCASE("indent") {
            pod_builder builder;
            builder.add_array({ std::int32_t{ 1 } });
            settings sett;
            sett.debug_indent = 4;
            CHECK(contains(dump(builder.view(), sett), "\n    [0] 1\n"));
        }
    }
}
