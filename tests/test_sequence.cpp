// tests/test_sequence.cpp
#include "tests.hpp"

#include "podcodec/pod/builder.hpp"
#include "podcodec/pod/sequence.hpp"

#include <cstdint>
#include <vector>

using namespace podcodec::core;
using namespace podcodec::pod;
using namespace podcodec::tests;

namespace param = podcodec::param;

TEST_SUITE("pod/sequence") {

    TEST_CASE("controls keep their offsets and payloads") {
        const auto note_on = from_u8({ 0x90, 0x3C, 0x7F });
        const auto osc = from_u8({ '/', 'a', 0, 0 });

        pod_builder builder;
        builder.add_sequence(0, [&](sequence_builder& seq) {
            seq.add_midi(10, note_on);
            seq.add_properties(20, [](object_builder& obj) {
                obj.add(param::props_catalog::key::volume, 0.5f);
            });
            seq.add_osc(30, osc);
        });

        const auto view = sequence_view::parse(builder.root());
        CHECK(view.unit() == 0);

        const auto controls = view.to_vector();
        REQUIRE(controls.size() == 3);
        CHECK(controls[0].offset == 10);
        CHECK(controls[1].offset == 20);
        CHECK(controls[2].offset == 30);

        CHECK(controls[0].kind() == control_type::midi);
        const auto midi = controls[0].decode();
        REQUIRE(std::holds_alternative<midi_event>(midi));
        CHECK(to_u8(std::get<midi_event>(midi).data) == to_u8(note_on));

        const auto props = controls[1].decode();
        REQUIRE(std::holds_alternative<props_cursor>(props));
        const auto values = std::get<props_cursor>(props).to_vector();
        REQUIRE(values.size() == 1);
        CHECK(values[0].key == param::props_catalog::key::volume);
        CHECK(values[0].get<float>() == 0.5f);

        const auto message = controls[2].decode();
        REQUIRE(std::holds_alternative<osc_event>(message));
        CHECK(std::get<osc_event>(message).data.size() == 4);
    }

    TEST_CASE("unit is stored in the body") {
        pod_builder builder;
        builder.add_sequence(48000, [](sequence_builder&) {});
        const auto root = builder.root();
        CHECK(root.size() == 8);
        const auto view = sequence_view::parse(root);
        CHECK(view.unit() == 48000);
        CHECK(view.begin() == view.end());
    }

    TEST_CASE("offsets are kept in written order") {
        const auto data = from_u8({ 0xF8 });
        pod_builder builder;
        builder.add_sequence(0, [&](sequence_builder& seq) {
            seq.add_midi(100, data);
            seq.add_midi(5, data);
        });
        std::vector<std::uint32_t> offsets;
        for (const auto& ctrl : sequence_view::parse(builder.root())) {
            offsets.push_back(ctrl.offset);
        }
        CHECK(offsets == std::vector<std::uint32_t>{ 100, 5 });
    }

    TEST_CASE("control payload errors") {
        SUBCASE("unknown control type") {
            pod_builder builder;
            builder.add_sequence(0, [](sequence_builder& seq) {
                seq.control(40, static_cast<control_type>(9), [](pod_builder& b) { b.add(std::int32_t{ 1 }); });
            });
            const auto controls = sequence_view::parse(builder.root()).to_vector();
            REQUIRE(controls.size() == 1);
            CHECK(error_of([&] { (void)controls[0].decode(); }) == error_kind::unexpected_control_type);
        }
        SUBCASE("properties control holding another object") {
            pod_builder builder;
            builder.add_sequence(0, [](sequence_builder& seq) {
                seq.control(5, control_type::properties, [](pod_builder& b) {
                    b.add_object(type::object_format, 4, [](object_builder&) {});
                });
            });
            const auto controls = sequence_view::parse(builder.root()).to_vector();
            CHECK(error_of([&] { (void)controls.at(0).decode(); }) == error_kind::unexpected_object_type);
        }
        SUBCASE("midi control without bytes") {
            pod_builder builder;
            builder.add_sequence(0, [](sequence_builder& seq) {
                seq.control(0, control_type::midi, [](pod_builder& b) { b.add(std::int32_t{ 1 }); });
            });
            const auto controls = sequence_view::parse(builder.root()).to_vector();
            CHECK(error_of([&] { (void)controls.at(0).decode(); }) == error_kind::wrong_pod_type_to_cast);
        }
        SUBCASE("invalid control carries no value") {
            pod_builder builder;
            builder.add_sequence(0, [](sequence_builder& seq) {
                seq.control(0, control_type::invalid, [](pod_builder& b) { b.add_none(); });
            });
            const auto controls = sequence_view::parse(builder.root()).to_vector();
            CHECK(std::holds_alternative<std::monostate>(controls.at(0).decode()));
        }
    }

    TEST_CASE("control claiming more bytes than remain") {
        // Sequence size 24: body, then a control whose Bytes pod claims 8 bytes
        const auto bytes = from_u8({
            24, 0, 0, 0,  16, 0, 0, 0,
            0, 0, 0, 0,   0, 0, 0, 0,
            0, 0, 0, 0,   2, 0, 0, 0,
            8, 0, 0, 0,   9, 0, 0, 0 });
        const auto view = sequence_view::parse(pod_view::parse(bytes));
        CHECK(error_of([&] { (void)view.to_vector(); }) == error_kind::data_too_short);
    }
}
