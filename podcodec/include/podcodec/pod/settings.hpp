/*
 * File: settings.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-21
 * License: MIT
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace podcodec::pod {
    struct settings {
        std::size_t initial_buffer_capacity = 256;
        std::size_t debug_max_depth = 16;
        std::size_t debug_max_elements = 64;
        std::size_t debug_indent = 2;
    };
    static_assert(settings{}.initial_buffer_capacity % 8 == 0, "capacity should be a multiple of the pod alignment");
    static_assert(settings{}.debug_max_depth > 0, "debug depth must be positive");
    static_assert(settings{}.debug_max_elements > 0, "debug element limit must be positive");
}
