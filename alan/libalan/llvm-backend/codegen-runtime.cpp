#include "codegen.hpp"

namespace alan {
	llvm::Function* Codegen::declare_primitive(const char* name, llvm::Type* return_type, const std::vector<llvm::Type*>& param_types, const std::vector<PassMode>& param_modes) {
		ASSERT(param_types.size() == param_modes.size());
		if (_symbols.find(name)) {
			fail(FaultMissingContext, "runtime function '%s' is declared twice", name);
			return NULL;
		}

		llvm::FunctionType* type = llvm::FunctionType::get(return_type, param_types, false);
		llvm::Function* F = llvm::Function::Create(type, llvm::GlobalValue::ExternalLinkage, name, _module.get());

		FunctionSymbol symbol;
		symbol.full_name = name;
		symbol.function = F;
		symbol.depth = 0;
		symbol.requires_access_link = false;
		symbol.param_modes = param_modes;
		if (!_symbols.declare(symbol)) {
			fail(FaultMissingContext, "could not register runtime function '%s'", name);
			return NULL;
		}
		return F;
	}

	llvm::Function* Codegen::define_primitive(const char* name, llvm::Type* return_type, const std::vector<llvm::Type*>& param_types, Builder& builder) {
		std::vector<PassMode> param_modes(param_types.size(), PassByValue);
		llvm::Function* F = declare_primitive(name, return_type, param_types, param_modes);
		if (!F) return NULL;
		builder.SetInsertPoint(llvm::BasicBlock::Create(_context, "entry", F));
		return F;
	}

	/*
		The runtime library provides the I/O and string primitives. The byte
		variants of integer I/O are glue defined right here.
	*/
	bool Codegen::declare_runtime() {
		llvm::Type* void_type = llvm::Type::getVoidTy(_context);
		llvm::Type* int_type = get_int_type();
		llvm::Type* byte_type = get_byte_type();
		llvm::Type* string_type = get_string_type();

		std::vector<llvm::Type*> none;
		std::vector<llvm::Type*> ints(1, int_type);
		std::vector<llvm::Type*> bytes(1, byte_type);
		std::vector<llvm::Type*> string(1, string_type);
		std::vector<llvm::Type*> strings(2, string_type);
		std::vector<llvm::Type*> int_and_string;
		int_and_string.push_back(int_type);
		int_and_string.push_back(string_type);

		std::vector<PassMode> no_modes;
		std::vector<PassMode> by_value(1, PassByValue);
		std::vector<PassMode> by_reference(1, PassByReference);
		std::vector<PassMode> two_by_reference(2, PassByReference);
		std::vector<PassMode> value_and_reference;
		value_and_reference.push_back(PassByValue);
		value_and_reference.push_back(PassByReference);

		llvm::Function* write_integer = declare_primitive("writeInteger", void_type, ints, by_value);
		llvm::Function* read_integer = declare_primitive("readInteger", int_type, none, no_modes);
		if (!write_integer || !read_integer) return false;
		if (!declare_primitive("writeChar", void_type, bytes, by_value)) return false;
		if (!declare_primitive("writeString", void_type, string, by_reference)) return false;
		if (!declare_primitive("readChar", byte_type, none, no_modes)) return false;
		if (!declare_primitive("readString", void_type, int_and_string, value_and_reference)) return false;
		if (!declare_primitive("strlen", int_type, string, by_reference)) return false;
		if (!declare_primitive("strcmp", int_type, strings, two_by_reference)) return false;
		if (!declare_primitive("strcpy", void_type, strings, two_by_reference)) return false;
		if (!declare_primitive("strcat", void_type, strings, two_by_reference)) return false;

		Builder builder(_context);

		// extend(b : byte) : int
		llvm::Function* extend = define_primitive("extend", int_type, bytes, builder);
		if (!extend) return false;
		builder.CreateRet(builder.CreateZExt(extend->getArg(0), int_type, "extend"));

		// shrink(i : int) : byte
		llvm::Function* shrink = define_primitive("shrink", byte_type, ints, builder);
		if (!shrink) return false;
		builder.CreateRet(builder.CreateTrunc(shrink->getArg(0), byte_type, "shrink"));

		// writeByte(b : byte)
		llvm::Function* write_byte = define_primitive("writeByte", void_type, bytes, builder);
		if (!write_byte) return false;
		llvm::Value* extended = builder.CreateCall(extend, write_byte->getArg(0), "extended");
		builder.CreateCall(write_integer, extended);
		builder.CreateRetVoid();

		// readByte() : byte
		llvm::Function* read_byte = define_primitive("readByte", byte_type, none, builder);
		if (!read_byte) return false;
		llvm::Value* n = builder.CreateCall(read_integer, llvm::None, "n");
		builder.CreateRet(builder.CreateCall(shrink, n, "shrunk"));

		return true;
	}
}
