/*
 * File: error.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-17
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>

#include "podcodec/pod/type.hpp"

namespace podcodec::pod {

    enum class error_kind {
        data_too_short,
        wrong_pod_type_to_cast,
        unknown_pod_type_to_downcast,
        string_is_not_null_terminated,
        index_is_out_of_range,
        unexpected_choice_element,
        unexpected_choice_element_size,
        unexpected_choice_type,
        unsupported_choice_element_type,
        unexpected_object_type,
        unexpected_control_type,
        pod_is_not_aligned,
    };

    constexpr inline std::string_view error_kind_name(error_kind kind) noexcept {
        switch (kind) {
        case error_kind::data_too_short: return "DataTooShort";
        case error_kind::wrong_pod_type_to_cast: return "WrongPodTypeToCast";
        case error_kind::unknown_pod_type_to_downcast: return "UnknownPodTypeToDowncast";
        case error_kind::string_is_not_null_terminated: return "StringIsNotNullTerminated";
        case error_kind::index_is_out_of_range: return "IndexIsOutOfRange";
        case error_kind::unexpected_choice_element: return "UnexpectedChoiceElement";
        case error_kind::unexpected_choice_element_size: return "UnexpectedChoiceElementSize";
        case error_kind::unexpected_choice_type: return "UnexpectedChoiceType";
        case error_kind::unsupported_choice_element_type: return "UnsupportedChoiceElementType";
        case error_kind::unexpected_object_type: return "UnexpectedObjectType";
        case error_kind::unexpected_control_type: return "UnexpectedControlType";
        case error_kind::pod_is_not_aligned: return "PodIsNotAligned";
        }
        return "Unknown";
    }

    /// Decode/encode failure. Every codec operation reports bad input by throwing
    /// this; `expected()`/`actual()` carry sizes, type tags or shape tags
    /// depending on the kind, zero when the kind has no payload.
    class pod_error : public std::runtime_error {
    public:

        pod_error(error_kind kind, std::uint64_t expected, std::uint64_t actual, const std::string& message)
            : std::runtime_error(message)
            , kind_(kind)
            , expected_(expected)
            , actual_(actual)
        {}

        error_kind kind() const noexcept { return kind_; }
        std::uint64_t expected() const noexcept { return expected_; }
        std::uint64_t actual() const noexcept { return actual_; }

        static pod_error data_too_short(std::size_t expected, std::size_t actual) {
            return pod_error(error_kind::data_too_short, expected, actual,
                std::format("data is too short: expected {} bytes, got {}", expected, actual));
        }

        static pod_error wrong_pod_type_to_cast(std::uint32_t expected, std::uint32_t actual) {
            return pod_error(error_kind::wrong_pod_type_to_cast, expected, actual,
                std::format("wrong pod type to cast: expected {}, got {}",
                    type_to_string(expected), type_to_string(actual)));
        }

        static pod_error wrong_pod_type_to_cast(type expected, std::uint32_t actual) {
            return wrong_pod_type_to_cast(to_tag(expected), actual);
        }

        static pod_error unknown_pod_type_to_downcast(std::uint32_t tag) {
            return pod_error(error_kind::unknown_pod_type_to_downcast, 0, tag,
                std::format("unknown pod type to downcast: {}", tag));
        }

        static pod_error string_is_not_null_terminated() {
            return pod_error(error_kind::string_is_not_null_terminated, 0, 0, "string is not null terminated");
        }

        static pod_error index_is_out_of_range(std::size_t size, std::size_t index) {
            return pod_error(error_kind::index_is_out_of_range, size, index,
                std::format("index {} is out of range, size is {}", index, size));
        }

        static pod_error unexpected_choice_element(std::size_t expected, std::size_t actual) {
            return pod_error(error_kind::unexpected_choice_element, expected, actual,
                std::format("unexpected choice element count: expected {}, got {}", expected, actual));
        }

        static pod_error unexpected_choice_element_size(std::size_t expected, std::size_t actual) {
            return pod_error(error_kind::unexpected_choice_element_size, expected, actual,
                std::format("unexpected choice element size: expected {}, got {}", expected, actual));
        }

        static pod_error unexpected_choice_type(std::uint32_t expected, std::uint32_t actual) {
            return pod_error(error_kind::unexpected_choice_type, expected, actual,
                std::format("unexpected choice type: expected {}, got {}",
                    choice_type_name(expected), choice_type_name(actual)));
        }

        static pod_error unsupported_choice_element_type(std::uint32_t tag) {
            return pod_error(error_kind::unsupported_choice_element_type, 0, tag,
                std::format("unsupported choice element type: {}", type_to_string(tag)));
        }

        static pod_error unexpected_object_type(std::uint32_t tag) {
            return pod_error(error_kind::unexpected_object_type, 0, tag,
                std::format("unexpected object type: {}", type_to_string(tag)));
        }

        static pod_error unexpected_control_type(std::uint32_t tag) {
            return pod_error(error_kind::unexpected_control_type, 0, tag,
                std::format("unexpected control type: {}", tag));
        }

        static pod_error pod_is_not_aligned(std::size_t position) {
            return pod_error(error_kind::pod_is_not_aligned, 0, position,
                std::format("pod is not aligned at position {}", position));
        }

    private:

        error_kind kind_;
        std::uint64_t expected_ = 0;
        std::uint64_t actual_ = 0;
    };

} // namespace podcodec::pod
