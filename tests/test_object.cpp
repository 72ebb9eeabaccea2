// tests/test_object.cpp
#include "tests.hpp"

#include "podcodec/pod/builder.hpp"
#include "podcodec/pod/object.hpp"
#include "podcodec/pod/struct.hpp"
#include "podcodec/param/media.hpp"

#include <cstdint>
#include <vector>

using namespace podcodec::core;
using namespace podcodec::pod;
using namespace podcodec::tests;

namespace param = podcodec::param;

namespace {

    constexpr std::uint32_t param_id(param::param_type kind) {
        return static_cast<std::uint32_t>(kind);
    }

    byte_buffer audio_dsp_format(param::param_type kind) {
        pod_builder builder;
        builder.add_object(type::object_format, param_id(kind), [](object_builder& obj) {
            obj.add(param::format_key::media_type, param::to_id(param::media_type::audio));
            obj.add(param::format_key::media_subtype, param::to_id(param::media_subtype::dsp));
        });
        return builder.release();
    }

    template <typename Cursor>
    std::vector<typename Cursor::value_type> properties_of(const object_value& value) {
        const auto* cursor = std::get_if<Cursor>(&value);
        REQUIRE(cursor != nullptr);
        return cursor->to_vector();
    }
}

TEST_SUITE("pod/object") {

    TEST_CASE("format object under both format catalogs") {
        const auto bytes = audio_dsp_format(param::param_type::format);
        const auto object = object_view::parse(pod_view::parse(bytes));
        CHECK(object.body_type() == type::object_format);
        CHECK(object.body_id() == param_id(param::param_type::format));

        const auto fixed = object.param_value(param::param_type::format);
        const auto enumerable = object.param_value(param::param_type::enum_format);
        CHECK(fixed.index() != enumerable.index());

        const auto fixed_props = properties_of<property_cursor<param::format_catalog>>(fixed);
        REQUIRE(fixed_props.size() == 2);
        CHECK(fixed_props[0].key == param::format_key::media_type);
        CHECK(fixed_props[0].get<id>() == param::to_id(param::media_type::audio));
        CHECK(fixed_props[0].name() == "mediaType");
        CHECK(fixed_props[1].key == param::format_key::media_subtype);
        CHECK(fixed_props[1].get<id>() == param::to_id(param::media_subtype::dsp));

        const auto enum_props = properties_of<property_cursor<param::enum_format_catalog>>(enumerable);
        REQUIRE(enum_props.size() == 2);
        CHECK(enum_props[0].key == param::format_key::media_type);
        CHECK(enum_props[1].key == param::format_key::media_subtype);
        CHECK(enum_props[1].get<id>() == param::to_id(param::media_subtype::dsp));
    }

    TEST_CASE("catalog inferred from the body") {
        SUBCASE("format id selects the fixed catalog") {
            const auto bytes = audio_dsp_format(param::param_type::format);
            const auto value = object_view::parse(pod_view::parse(bytes)).value();
            CHECK(std::holds_alternative<property_cursor<param::format_catalog>>(value));
        }
        SUBCASE("any other id selects the enumerable catalog") {
            const auto bytes = audio_dsp_format(param::param_type::enum_format);
            const auto value = object_view::parse(pod_view::parse(bytes)).value();
            CHECK(std::holds_alternative<property_cursor<param::enum_format_catalog>>(value));
        }
        SUBCASE("non format objects use their own catalog") {
            pod_builder builder;
            builder.add_object(type::object_param_buffers, param_id(param::param_type::buffers), [](object_builder& obj) {
                obj.add_choice(param::buffers_catalog::key::buffers, choice_value<std::int32_t>::range(8, 2, 16));
                obj.add(param::buffers_catalog::key::size, std::int32_t{ 4096 });
            });
            const auto value = object_view::parse(builder.root()).value();
            const auto props = properties_of<property_cursor<param::buffers_catalog>>(value);
            REQUIRE(props.size() == 2);
            CHECK(props[0].choice<std::int32_t>().kind() == choice_type::range);
            CHECK(props[1].choice<std::int32_t>().is_shortcut());
            CHECK(props[1].choice<std::int32_t>().default_value() == 4096);
        }
        SUBCASE("unknown body type") {
            pod_builder builder;
            builder.add_object(static_cast<type>(0x4ffff), 0, [](object_builder&) {});
            const auto object = object_view::parse(builder.root());
            CHECK(error_of([&] { (void)object.value(); }) == error_kind::unexpected_object_type);
            CHECK(error_of([&] { (void)object.param_value(param::param_type::invalid); })
                == error_kind::unexpected_object_type);
        }
    }

    TEST_CASE("explicit kind must agree with the body type") {
        pod_builder builder;
        builder.add_object(type::object_props, param_id(param::param_type::props), [](object_builder& obj) {
            obj.add(param::props_catalog::key::volume, 0.75f);
        });
        const auto object = object_view::parse(builder.root());

        CHECK(error_of([&] { (void)object.param_value(param::param_type::route); })
            == error_kind::unexpected_object_type);
        CHECK(error_of([&] { (void)object.param_value(param::param_type::format); })
            == error_kind::unexpected_object_type);

        const auto fallback = object.param_value(param::param_type::control);
        CHECK(std::holds_alternative<property_cursor<param::props_catalog>>(fallback));
    }

    TEST_CASE("property values are checked against the catalog") {
        SUBCASE("unknown key") {
            pod_builder builder;
            builder.add_object(type::object_props, 0, [](object_builder& obj) {
                obj.add(std::uint32_t{ 0x999 }, std::int32_t{ 1 });
            });
            const auto value = object_view::parse(builder.root()).value();
            CHECK(error_of([&] { (void)properties_of<property_cursor<param::props_catalog>>(value); })
                == error_kind::unknown_pod_type_to_downcast);
        }
        SUBCASE("wrong value type") {
            pod_builder builder;
            builder.add_object(type::object_props, 0, [](object_builder& obj) {
                obj.add(param::props_catalog::key::volume, std::int32_t{ 1 });
            });
            const auto value = object_view::parse(builder.root()).value();
            CHECK(error_of([&] { (void)properties_of<property_cursor<param::props_catalog>>(value); })
                == error_kind::wrong_pod_type_to_cast);
        }
        SUBCASE("array element type") {
            pod_builder builder;
            builder.add_object(type::object_props, 0, [](object_builder& obj) {
                obj.add_array(param::props_catalog::key::channel_volumes, { std::int32_t{ 1 } });
            });
            const auto value = object_view::parse(builder.root()).value();
            CHECK(error_of([&] { (void)properties_of<property_cursor<param::props_catalog>>(value); })
                == error_kind::wrong_pod_type_to_cast);
        }
        SUBCASE("choice where the fixed catalog wants a plain value") {
            pod_builder builder;
            builder.add_object(type::object_format, param_id(param::param_type::format), [](object_builder& obj) {
                obj.add_choice(param::format_key::audio_format,
                    choice_value<id>::enumeration(param::to_id(param::audio_format::f32p), { param::to_id(param::audio_format::s16_le) }));
            });
            const auto object = object_view::parse(builder.root());
            CHECK(error_of([&] { (void)properties_of<property_cursor<param::format_catalog>>(object.value()); })
                == error_kind::wrong_pod_type_to_cast);

            const auto props = properties_of<property_cursor<param::enum_format_catalog>>(
                object.param_value(param::param_type::enum_format));
            REQUIRE(props.size() == 1);
            CHECK(props[0].choice<id>().kind() == choice_type::enumeration);
        }
    }

    TEST_CASE("route with nested containers") {
        pod_builder builder;
        builder.add_object(type::object_param_route, param_id(param::param_type::route), [](object_builder& obj) {
            using key = param::route_catalog::key;
            obj.add(key::index, std::int32_t{ 1 });
            obj.add(key::direction, param::to_id(param::direction::output));
            obj.add(key::name, "analog-output");
            obj.add_struct(key::info, [](pod_builder& b) {
                b.add(std::int32_t{ 1 });
                b.add("port.type");
                b.add("analog");
            });
            obj.add_array(key::profiles, { std::int32_t{ 1 }, std::int32_t{ 2 } });
            obj.add_object(key::props, type::object_props, param_id(param::param_type::route), [](object_builder& props) {
                props.add(param::props_catalog::key::mute, false);
                props.add_array(param::props_catalog::key::channel_volumes, { 0.5f, 0.25f });
            });
            obj.add(key::save, true, prop_flags::readonly | prop_flags::hardware);
        });

        const auto props = properties_of<property_cursor<param::route_catalog>>(
            object_view::parse(builder.root()).value());
        REQUIRE(props.size() == 7);

        CHECK(props[0].get<std::int32_t>() == 1);
        CHECK(param::from_id<param::direction>(props[1].get<id>()) == param::direction::output);
        CHECK(props[2].value.get_string() == "analog-output");
        CHECK(struct_view::parse(props[3].value).size() == 3);
        CHECK(props[4].array<std::int32_t>().to_vector() == std::vector<std::int32_t>{ 1, 2 });

        const auto nested = properties_of<property_cursor<param::props_catalog>>(
            object_view::parse(props[5].value).value());
        REQUIRE(nested.size() == 2);
        CHECK(nested[0].get<bool>() == false);
        CHECK(nested[1].array<float>().to_vector() == std::vector<float>{ 0.5f, 0.25f });

        CHECK(props[6].get<bool>());
        CHECK(props[6].has(prop_flags::readonly));
        CHECK(props[6].has(prop_flags::hardware));
        CHECK_FALSE(props[6].has(prop_flags::mandatory));
        CHECK_FALSE(props[0].has(prop_flags::readonly));
    }

    TEST_CASE("find by key") {
        const auto bytes = audio_dsp_format(param::param_type::format);
        const auto object = object_view::parse(pod_view::parse(bytes));

        const auto subtype = object.find(param::format_key::media_subtype);
        REQUIRE(subtype.has_value());
        CHECK(subtype->value.get<id>() == param::to_id(param::media_subtype::dsp));
        CHECK_FALSE(object.find(param::format_key::audio_rate).has_value());
    }

    TEST_CASE("in place edits") {
        auto bytes = audio_dsp_format(param::param_type::format);

        set_body_id(bytes, param_id(param::param_type::enum_format));
        const auto object = object_view::parse(pod_view::parse(bytes));
        CHECK(object.body_id() == param_id(param::param_type::enum_format));
        CHECK(std::holds_alternative<property_cursor<param::enum_format_catalog>>(object.value()));

        CHECK(set_property_flags(bytes, param::format_key::media_subtype, prop_flags::mandatory));
        CHECK_FALSE(set_property_flags(bytes, param::format_key::audio_rate, prop_flags::mandatory));

        const auto edited = object_view::parse(pod_view::parse(bytes));
        CHECK(edited.find(param::format_key::media_type)->flags == prop_flags::none);
        CHECK(edited.find(param::format_key::media_subtype)->flags == prop_flags::mandatory);
        CHECK(edited.find(param::format_key::media_subtype)->value.get<id>()
            == param::to_id(param::media_subtype::dsp));

        auto not_object = encode(std::int32_t{ 1 });
        CHECK(error_of([&] { set_body_id(not_object, 1); }) == error_kind::wrong_pod_type_to_cast);
    }

    TEST_CASE("empty object") {
        pod_builder builder;
        builder.add_object(type::object_param_latency, param_id(param::param_type::latency), [](object_builder&) {});
        CHECK(builder.root().size() == 8);
        const auto props = properties_of<property_cursor<param::latency_catalog>>(
            object_view::parse(builder.root()).value());
        CHECK(props.empty());
    }
}
