/*
 * File: choice.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-23
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <variant>
#include <vector>

#include "podcodec/pod/cursor.hpp"
#include "podcodec/pod/view.hpp"

namespace podcodec::pod {

    template <typename T>
    struct value_choice {
        T value;
        friend bool operator == (const value_choice&, const value_choice&) = default;
    };

    template <typename T>
    struct none_choice {
        T value;
        friend bool operator == (const none_choice&, const none_choice&) = default;
    };

    template <typename T>
    struct range_choice {
        T default_value;
        T min;
        T max;
        friend bool operator == (const range_choice&, const range_choice&) = default;
    };

    template <typename T>
    struct step_choice {
        T default_value;
        T min;
        T max;
        T step;
        friend bool operator == (const step_choice&, const step_choice&) = default;
    };

    template <typename T>
    struct enum_choice {
        T default_value;
        std::vector<T> alternatives;
        friend bool operator == (const enum_choice&, const enum_choice&) = default;
    };

    template <typename T>
    struct flags_choice {
        T default_value;
        std::vector<T> flags;
        friend bool operator == (const flags_choice&, const flags_choice&) = default;
    };

    /// Decoded choice. `value_choice` is the shortcut form: a bare T on the
    /// wire where a choice was expected. It reports choice_type::none and equals
    /// the NONE choice of the same value. It is written back as a bare T.
    template <Element T>
    class choice_value {
    public:
        using value_type = T;
        using variant_type = std::variant<
            value_choice<T>,
            none_choice<T>,
            range_choice<T>,
            step_choice<T>,
            enum_choice<T>,
            flags_choice<T>
        >;

        choice_value(variant_type shape)
            : shape_(std::move(shape))
        {}

        static choice_value value(T v) { return variant_type{ value_choice<T>{ std::move(v) } }; }
        static choice_value none(T v) { return variant_type{ none_choice<T>{ std::move(v) } }; }

        static choice_value range(T def, T min, T max) {
            return variant_type{ range_choice<T>{ std::move(def), std::move(min), std::move(max) } };
        }

        static choice_value step(T def, T min, T max, T step) {
            return variant_type{ step_choice<T>{ std::move(def), std::move(min), std::move(max), std::move(step) } };
        }

        static choice_value enumeration(T def, std::vector<T> alternatives) {
            return variant_type{ enum_choice<T>{ std::move(def), std::move(alternatives) } };
        }

        static choice_value flags(T def, std::vector<T> flags) {
            return variant_type{ flags_choice<T>{ std::move(def), std::move(flags) } };
        }

        choice_type kind() const noexcept {
            switch (shape_.index()) {
            case 2: return choice_type::range;
            case 3: return choice_type::step;
            case 4: return choice_type::enumeration;
            case 5: return choice_type::flags;
            default: break;
            }
            return choice_type::none;
        }

        bool is_shortcut() const noexcept {
            return std::holds_alternative<value_choice<T>>(shape_);
        }

        const T& default_value() const {
            return std::visit([](const auto& shape) -> const T& {
                using shape_type = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<shape_type, value_choice<T>> || std::is_same_v<shape_type, none_choice<T>>) {
                    return shape.value;
                }
                else {
                    return shape.default_value;
                }
            }, shape_);
        }

        const variant_type& shape() const noexcept {
            return shape_;
        }

        template <typename ShapeT>
        const ShapeT* get_if() const noexcept {
            return std::get_if<ShapeT>(&shape_);
        }

        /// Elements in wire order, default first.
        std::vector<T> elements() const {
            return std::visit([](const auto& shape) -> std::vector<T> {
                using shape_type = std::decay_t<decltype(shape)>;
                if constexpr (std::is_same_v<shape_type, value_choice<T>> || std::is_same_v<shape_type, none_choice<T>>) {
                    return { shape.value };
                }
                else if constexpr (std::is_same_v<shape_type, range_choice<T>>) {
                    return { shape.default_value, shape.min, shape.max };
                }
                else if constexpr (std::is_same_v<shape_type, step_choice<T>>) {
                    return { shape.default_value, shape.min, shape.max, shape.step };
                }
                else if constexpr (std::is_same_v<shape_type, enum_choice<T>>) {
                    std::vector<T> result{ shape.default_value };
                    result.insert(result.end(), shape.alternatives.begin(), shape.alternatives.end());
                    return result;
                }
                else {
                    std::vector<T> result{ shape.default_value };
                    result.insert(result.end(), shape.flags.begin(), shape.flags.end());
                    return result;
                }
            }, shape_);
        }

        /// The bare shortcut and an explicit NONE both mean "exactly this value"
        /// and compare equal when the values do.
        friend bool operator == (const choice_value& lhs, const choice_value& rhs) {
            if (lhs.single_value() && rhs.single_value()) {
                return lhs.default_value() == rhs.default_value();
            }
            return lhs.shape_ == rhs.shape_;
        }

    private:

        bool single_value() const noexcept {
            return shape_.index() < 2;
        }

        variant_type shape_;
    };

    class choice_view {
    public:

        choice_view() = default;

        static choice_view parse(const pod_view& pod) {
            pod.expect(type::choice);
            const auto payload = pod.payload();
            return choice_view(load<choice_body>(payload), payload.subspan(sizeof(choice_body)));
        }

        std::uint32_t kind_tag() const noexcept { return kind_; }
        choice_type kind() const noexcept { return static_cast<choice_type>(kind_); }
        std::uint32_t flags() const noexcept { return flags_; }
        pod::type child_type() const noexcept { return static_cast<pod::type>(child_type_); }
        std::uint32_t child_type_tag() const noexcept { return child_type_; }
        std::uint32_t child_size() const noexcept { return child_size_; }
        byte_view elements() const noexcept { return region_; }

        std::size_t element_count() const noexcept {
            return child_size_ == 0 ? 0 : region_.size() / child_size_;
        }

        /// Decodes the elements as T according to the shape tag.
        /// `T = raw_value` accepts any child type.
        template <Element T>
        choice_value<T> value() const {
            using codec = primitive_codec<T>;
            if constexpr (codec::tag != type::pod) {
                if (child_type_ != to_tag(codec::tag)) {
                    throw pod_error::wrong_pod_type_to_cast(codec::tag, child_type_);
                }
            }
            if (child_size_ == 0) {
                if (!region_.empty()) {
                    throw pod_error::unexpected_choice_element_size(codec::wire_size, 0);
                }
            }
            else if (region_.size() % child_size_ != 0) {
                throw pod_error::unexpected_choice_element_size(child_size_, region_.size() % child_size_);
            }

            value_cursor<codec> cursor(region_, child_size_);
            const auto total = cursor.remaining();

            const auto exactly = [&](std::size_t count) {
                if (total != count) {
                    throw pod_error::unexpected_choice_element(count, total);
                }
            };

            switch (kind()) {
            case choice_type::none: {
                exactly(1);
                return choice_value<T>::none(*cursor.next());
            }
            case choice_type::range: {
                exactly(3);
                auto def = *cursor.next();
                auto min = *cursor.next();
                auto max = *cursor.next();
                return choice_value<T>::range(std::move(def), std::move(min), std::move(max));
            }
            case choice_type::step: {
                exactly(4);
                auto def = *cursor.next();
                auto min = *cursor.next();
                auto max = *cursor.next();
                auto step = *cursor.next();
                return choice_value<T>::step(std::move(def), std::move(min), std::move(max), std::move(step));
            }
            case choice_type::enumeration:
            case choice_type::flags: {
                auto def = cursor.next();
                if (!def) {
                    throw pod_error::data_too_short(codec::wire_size, region_.size());
                }
                auto rest = collect(cursor);
                if (kind() == choice_type::enumeration) {
                    return choice_value<T>::enumeration(std::move(*def), std::move(rest));
                }
                return choice_value<T>::flags(std::move(*def), std::move(rest));
            }
            }
            throw pod_error::unknown_pod_type_to_downcast(kind_);
        }

    private:

        choice_view(const choice_body& body, byte_view region)
            : region_(region)
            , kind_(body.type.get())
            , flags_(body.flags.get())
            , child_type_(body.child.type.get())
            , child_size_(body.child.size.get())
        {}

        byte_view region_ = {};
        std::uint32_t kind_ = 0;
        std::uint32_t flags_ = 0;
        std::uint32_t child_type_ = 0;
        std::uint32_t child_size_ = 0;
    };

    /// Decodes a slot that expects Choice<T>: a Choice POD, or a bare T taken
    /// as the value shortcut.
    template <Element T>
    inline choice_value<T> parse_choice(const pod_view& pod) {
        using codec = primitive_codec<T>;
        if (pod.is(type::choice)) {
            return choice_view::parse(pod).value<T>();
        }
        if constexpr (codec::tag == type::pod) {
            return choice_value<T>::value(raw_value{ pod.payload() });
        }
        else {
            if (pod.is(codec::tag)) {
                return choice_value<T>::value(pod.get<T>());
            }
            throw pod_error::unsupported_choice_element_type(pod.type_tag());
        }
    }

    template <Element T>
    inline choice_value<T> parse_choice_as(const pod_view& pod, choice_type expected) {
        auto result = parse_choice<T>(pod);
        if (result.kind() != expected) {
            throw pod_error::unexpected_choice_type(static_cast<std::uint32_t>(expected),
                static_cast<std::uint32_t>(result.kind()));
        }
        return result;
    }

    using any_choice = std::variant<
        choice_value<bool>,
        choice_value<id>,
        choice_value<std::int32_t>,
        choice_value<std::int64_t>,
        choice_value<float>,
        choice_value<double>,
        choice_value<rectangle>,
        choice_value<fraction>
    >;

    /// Untyped decode. Only the scalar types a choice is defined over are accepted.
    inline any_choice decode_any_choice(const pod_view& pod) {
        const auto element_type = pod.is(type::choice)
            ? choice_view::parse(pod).child_type()
            : pod.type();
        switch (element_type) {
        case type::boolean: return parse_choice<bool>(pod);
        case type::id: return parse_choice<id>(pod);
        case type::int32: return parse_choice<std::int32_t>(pod);
        case type::int64: return parse_choice<std::int64_t>(pod);
        case type::float32: return parse_choice<float>(pod);
        case type::float64: return parse_choice<double>(pod);
        case type::rectangle: return parse_choice<rectangle>(pod);
        case type::fraction: return parse_choice<fraction>(pod);
        default: break;
        }
        throw pod_error::unsupported_choice_element_type(to_tag(element_type));
    }

    template <Primitive T>
    inline std::size_t write_choice(pod_buffer& buf, const choice_value<T>& choice, std::uint32_t flags = 0) {
        using codec = primitive_codec<T>;
        if (choice.is_shortcut()) {
            return write_primitive(buf, choice.default_value());
        }
        const auto items = choice.elements();
        return buf.count_written([&] {
            std::size_t element_size = 0;
            buf.write_end_then_start(sizeof(pod_header) + sizeof(choice_body),
                [&] {
                    for (std::size_t i = 0; i < items.size(); ++i) {
                        const auto written = buf.count_written([&] { codec::store(buf, items[i]); });
                        if (i == 0) {
                            element_size = written;
                        }
                        else if (written != element_size) {
                            throw pod_error::unexpected_choice_element_size(element_size, written);
                        }
                    }
                },
                [&](std::size_t body_size) {
                    buf.write_header(static_cast<std::uint32_t>(sizeof(choice_body) + body_size), type::choice);
                    choice_body body;
                    body.type = static_cast<std::uint32_t>(choice.kind());
                    body.flags = flags;
                    body.child.size = static_cast<std::uint32_t>(items.empty() ? codec::wire_size : body_size / items.size());
                    body.child.type = to_tag(codec::tag);
                    buf.put_struct(body);
                });
            buf.pad();
        });
    }

    /// Writes whichever typed choice the variant holds.
    inline std::size_t write_any_choice(pod_buffer& buf, const any_choice& choice, std::uint32_t flags = 0) {
        return std::visit([&](const auto& typed) { return write_choice(buf, typed, flags); }, choice);
    }

} // namespace podcodec::pod
