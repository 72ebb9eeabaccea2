/*
 * File: debug.hpp
 * Author: newenclave
 * GitHub: https://github.com/newenclave
 * Created: 2026-09-15
 * License: MIT
 */


#pragma once

#include <cstdlib>
#include <iostream>

namespace podcodec::core {

	[[noreturn]] inline void assertion_failed(const char* cond, const char* msg, const char* file, int line) {
		std::cerr << file << ":" << line << ": assertion '" << cond << "' failed: " << msg << std::endl;
		std::abort();
	}

} // namespace podcodec::core

// Writer accounting checks. Stays active in release builds: a mismatch
// means the encoder produced a corrupt stream.
#ifndef PODCODEC_ASSERT
#define PODCODEC_ASSERT(cond, msg) do { \
		if (!(cond)) { \
			::podcodec::core::assertion_failed(#cond, msg, __FILE__, __LINE__); \
		} \
	} while(0)
#endif
