#include "basic.hpp"

#include <stdlib.h>

namespace alan {
	char* vformat_string(const char* fmt, va_list ap) {
		char* str = NULL;
		if (vasprintf(&str, fmt, ap) < 0) return NULL;
		return str;
	}

	char* format_string(const char* fmt, ...) {
		va_list ap;
		va_start(ap, fmt);
		char* str = vformat_string(fmt, ap);
		va_end(ap);
		return str;
	}
}
