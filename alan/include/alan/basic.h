#pragma once
#ifndef BASIC_H_Q3W8RX1C
#define BASIC_H_Q3W8RX1C

#include <inttypes.h>
#include <stdbool.h>
#include <stdint.h>
#include <stddef.h>
#include <stdio.h>
#include <stdarg.h>
#include <string.h>

#ifndef byte
typedef unsigned char byte;
#endif

#define TRAP() do { fprintf(stderr, "TRAP AT %s:%d (%s)!\n", __FILE__, __LINE__, __func__); __builtin_abort(); } while (0)
#define ASSERT(x) do { if (!(x)) { fprintf(stderr, "ASSERTION FAILED: %s\n", #x); TRAP(); } } while (0)

#endif /* end of include guard: BASIC_H_Q3W8RX1C */
