/*
 * File: debug_print.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-30
 * License: MIT
 */

#pragma once

#include <format>
#include <ostream>
#include <string>

#include "podcodec/pod/settings.hpp"
#include "podcodec/pod/value.hpp"

namespace podcodec::pod {

    /// Human readable dump of a POD tree. Never throws on malformed input:
    /// corrupted subtrees are printed as `<error: ...>` and unknown tags as
    /// `UNKNOWN(tag)`.
    class pod_printer {
    public:

        explicit pod_printer(std::ostream& os, const settings& sett = {})
            : os_(os)
            , settings_(sett)
        {}

        std::ostream& print(const pod_view& pod, std::size_t depth = 0) {
            const auto pad = padding(depth);
            if (depth >= settings_.debug_max_depth) {
                os_ << pad << "...\n";
                return os_;
            }
            try {
                dump(pod, depth);
            }
            catch (const pod_error& e) {
                os_ << pad << "<error: " << e.what() << ">\n";
            }
            return os_;
        }

        std::ostream& print(byte_view bytes) {
            try {
                return print(pod_view::parse(bytes));
            }
            catch (const pod_error& e) {
                os_ << "<error: " << e.what() << ">\n";
            }
            return os_;
        }

    private:

        std::string padding(std::size_t depth) const {
            return std::string(depth * settings_.debug_indent, ' ');
        }

        // scalar payload without header, false when the type is not a scalar
        bool scalar(std::uint32_t tag, std::size_t size, byte_view bytes) {
            switch (static_cast<type>(tag)) {
            case type::boolean: os_ << (primitive_codec<bool>::parse(size, bytes) ? "true" : "false"); return true;
            case type::id: os_ << primitive_codec<id>::parse(size, bytes); return true;
            case type::int32: os_ << primitive_codec<std::int32_t>::parse(size, bytes); return true;
            case type::int64: os_ << primitive_codec<std::int64_t>::parse(size, bytes); return true;
            case type::float32: os_ << primitive_codec<float>::parse(size, bytes); return true;
            case type::float64: os_ << primitive_codec<double>::parse(size, bytes); return true;
            case type::rectangle: os_ << primitive_codec<rectangle>::parse(size, bytes); return true;
            case type::fraction: os_ << primitive_codec<fraction>::parse(size, bytes); return true;
            case type::fd: os_ << primitive_codec<fd>::parse(size, bytes); return true;
            case type::pointer: {
                const auto ptr = primitive_codec<pointer>::parse(size, bytes);
                os_ << type_to_string(ptr.pointer_type) << std::format(" 0x{:x}", ptr.address);
                return true;
            }
            default:
                break;
            }
            return false;
        }

        void elements(std::uint32_t child_type, std::uint32_t child_size, byte_view region, std::size_t depth) {
            const auto pad = padding(depth);
            value_cursor<primitive_codec<raw_value>> cursor(region, child_size);
            std::size_t index = 0;
            while (auto item = cursor.next()) {
                if (index == settings_.debug_max_elements) {
                    os_ << pad << "... " << (cursor.remaining() + 1) << " more\n";
                    break;
                }
                os_ << pad << "[" << index++ << "] ";
                if (!scalar(child_type, child_size, item->bytes)) {
                    os_ << type_to_string(child_type) << " " << item->bytes.size() << " bytes";
                }
                os_ << "\n";
            }
        }

        void dump(const pod_view& pod, std::size_t depth) {
            const auto pad = padding(depth);
            const auto name = type_to_string(pod.type_tag());

            if (!is_basic_type(pod.type_tag())) {
                os_ << pad << name << " size=" << pod.size() << "\n";
                return;
            }

            switch (pod.type()) {
            case type::none:
                os_ << pad << name << "\n";
                break;
            case type::string:
                os_ << pad << name << ": \"" << pod.get_string() << "\"\n";
                break;
            case type::bytes:
                os_ << pad << name << ": " << pod.get_bytes().size() << " bytes\n";
                break;
            case type::bitmap: {
                const auto bits = pod.get_bitmap();
                os_ << pad << name << ": " << bits.bits_count() << " bits, " << bits.popcount() << " set\n";
                break;
            }
            case type::array: {
                const auto arr = array_view<>::parse(pod);
                os_ << pad << name << " child=" << type_to_string(to_tag(arr.child_type()))
                    << " count=" << arr.size() << ":\n";
                elements(to_tag(arr.child_type()), arr.child_size(), arr.elements(), depth + 1);
                break;
            }
            case type::choice: {
                const auto choice = choice_view::parse(pod);
                const auto shape = choice_type_name(choice.kind_tag());
                os_ << pad << name << " " << (shape.empty() ? std::format("UNKNOWN({})", choice.kind_tag()) : std::string(shape))
                    << " flags=" << choice.flags()
                    << " child=" << type_to_string(choice.child_type_tag()) << ":\n";
                elements(choice.child_type_tag(), choice.child_size(), choice.elements(), depth + 1);
                break;
            }
            case type::structure: {
                os_ << pad << name << ":\n";
                std::size_t index = 0;
                for (const auto& member : struct_view::parse(pod)) {
                    os_ << padding(depth + 1) << "[" << index++ << "]\n";
                    print(member, depth + 2);
                }
                break;
            }
            case type::object: {
                const auto object = object_view::parse(pod);
                os_ << pad << name << " type=" << type_to_string(object.body_type_tag())
                    << " id=" << object.body_id() << ":\n";
                for (const auto& prop : object) {
                    os_ << padding(depth + 1) << "key=" << prop.key
                        << " flags=" << static_cast<std::uint32_t>(prop.flags) << "\n";
                    print(prop.value, depth + 2);
                }
                break;
            }
            case type::sequence: {
                const auto seq = sequence_view::parse(pod);
                os_ << pad << name << " unit=" << seq.unit() << ":\n";
                for (const auto& ctrl : seq) {
                    os_ << padding(depth + 1) << "offset=" << ctrl.offset << " type=" << ctrl.type << "\n";
                    print(ctrl.value, depth + 2);
                }
                break;
            }
            default:
                os_ << pad << name << ": ";
                if (!scalar(pod.type_tag(), pod.size(), pod.payload())) {
                    os_ << pod.size() << " bytes";
                }
                os_ << "\n";
                break;
            }
        }

        std::ostream& os_;
        settings settings_;
    };

    inline std::ostream& debug_print(std::ostream& os, const pod_view& pod, const settings& sett = {}) {
        return pod_printer(os, sett).print(pod);
    }

    inline std::ostream& debug_print(std::ostream& os, byte_view bytes, const settings& sett = {}) {
        return pod_printer(os, sett).print(bytes);
    }

    inline std::ostream& operator << (std::ostream& os, const pod_view& pod) {
        return debug_print(os, pod);
    }

} // namespace podcodec::pod
