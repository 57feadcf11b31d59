#pragma once
#ifndef COLOR_HPP_V7A2LK0R
#define COLOR_HPP_V7A2LK0R

namespace alan { namespace test { namespace color {
	static const char* reset = "\x1b[0m";
	static const char* red = "\x1b[1;31m";
	static const char* yellow = "\x1b[1;33m";
	static const char* green = "\x1b[1;32m";
	static const char* cyan = "\x1b[1;36m";
}}}

#endif /* end of include guard: COLOR_HPP_V7A2LK0R */
