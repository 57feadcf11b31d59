#pragma once
#ifndef BASIC_HPP_H4TX0LQ2
#define BASIC_HPP_H4TX0LQ2

#include "alan/basic.h"

#include <string>

namespace alan {
	// Formats like printf into a freshly malloc'ed string. The caller owns the result.
	char* format_string(const char* fmt, ...) __attribute__((format(printf, 1, 2)));
	char* vformat_string(const char* fmt, va_list ap);
}

#endif /* end of include guard: BASIC_HPP_H4TX0LQ2 */
