#pragma once
#ifndef TYPE_HPP_K2M9VQ4T
#define TYPE_HPP_K2M9VQ4T

#include "alan/basic.h"

namespace alan {
	enum TypeKind {
		TypeNone,  // unresolved; never valid in a checked tree
		TypeInt,
		TypeByte,
		TypeArray,
		TypeProc   // "no value", only valid as a return type
	};

	/*
		Arrays are one-dimensional, fixed size, and hold either int or byte.
		`element` is only meaningful when kind == TypeArray.
	*/
	struct Type {
		TypeKind kind;
		TypeKind element;
		uint32_t size;

		static Type None()  { Type t = { TypeNone, TypeNone, 0 }; return t; }
		static Type Int()   { Type t = { TypeInt, TypeNone, 0 }; return t; }
		static Type Byte()  { Type t = { TypeByte, TypeNone, 0 }; return t; }
		static Type Proc()  { Type t = { TypeProc, TypeNone, 0 }; return t; }
		static Type Array(TypeKind element, uint32_t size) { Type t = { TypeArray, element, size }; return t; }

		bool is_array() const { return kind == TypeArray; }
		bool is_scalar() const { return kind == TypeInt || kind == TypeByte; }
		Type element_type() const { Type t = { element, TypeNone, 0 }; return t; }

		bool operator==(const Type& other) const {
			return kind == other.kind && (kind != TypeArray || (element == other.element && size == other.size));
		}
		bool operator!=(const Type& other) const { return !(*this == other); }
		bool operator==(TypeKind k) const { return kind == k; }
		bool operator!=(TypeKind k) const { return kind != k; }
	};

	const char* type_kind_name(TypeKind kind);
}

#endif /* end of include guard: TYPE_HPP_K2M9VQ4T */
