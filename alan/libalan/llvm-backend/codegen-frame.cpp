#include "codegen.hpp"

namespace alan {
	llvm::Type* Codegen::get_value_type(const Type& type) {
		switch (type.kind) {
			case TypeInt:  return get_int_type();
			case TypeByte: return get_byte_type();
			case TypeArray: {
				// element type can only be int or byte
				if (type.element != TypeInt && type.element != TypeByte) {
					fail(FaultTypeMapping, "array of %s has no target type", type_kind_name(type.element));
					return NULL;
				}
				return llvm::ArrayType::get(get_value_type(type.element_type()), type.size);
			}
			default:
				fail(FaultTypeMapping, "%s is not a value type", type_kind_name(type.kind));
				return NULL;
		}
	}

	llvm::Type* Codegen::get_return_type(const Type& type) {
		switch (type.kind) {
			case TypeInt:  return get_int_type();
			case TypeByte: return get_byte_type();
			case TypeProc: return llvm::Type::getVoidTy(_context);
			default:
				fail(FaultTypeMapping, "%s is not a return type", type_kind_name(type.kind));
				return NULL;
		}
	}

	llvm::Type* Codegen::get_parameter_type(const Parameter& param) {
		if (param.type.is_array()) {
			// arrays travel as a pointer to their first element
			llvm::Type* element = get_value_type(param.type.element_type());
			return element ? llvm::PointerType::getUnqual(element) : NULL;
		}
		llvm::Type* type = get_value_type(param.type);
		if (!type) return NULL;
		if (param.pass == PassByReference) return llvm::PointerType::getUnqual(type);
		return type;
	}

	/*
		Frame layout:
			0          pointer to the parent's frame (the access link)
			1 .. k     declared parameters, as passed
			k+1 .. k+m local variables, stored inline
		Nested functions take no room in the frame.
	*/
	llvm::StructType* Codegen::build_frame_type(const FunctionDecl& f, llvm::StructType* parent_frame_type) {
		ASSERT(parent_frame_type != NULL);

		std::vector<llvm::Type*> fields;
		fields.reserve(1 + f.params.size() + f.locals.size());
		fields.push_back(llvm::PointerType::getUnqual(parent_frame_type));

		for (FunctionDecl::Parameters::const_iterator it = f.params.begin(); it != f.params.end(); ++it) {
			llvm::Type* type = get_parameter_type(*it);
			if (!type) {
				fail(FaultTypeMapping, "parameter '%s' of '%s'", it->name, f.full_name);
				return NULL;
			}
			fields.push_back(type);
		}

		for (FunctionDecl::Locals::const_iterator it = f.locals.begin(); it != f.locals.end(); ++it) {
			if (it->kind != LocalDecl::Variable) continue;
			llvm::Type* type = get_value_type(it->type);
			if (!type) {
				fail(FaultTypeMapping, "local variable '%s' of '%s'", it->name, f.full_name);
				return NULL;
			}
			fields.push_back(type);
		}

		return llvm::StructType::create(_context, fields, (llvm::Twine("frame.") + f.full_name).str());
	}

	llvm::FunctionType* Codegen::get_function_type(const FunctionDecl& f, llvm::StructType* parent_frame_type, bool requires_access_link) {
		llvm::Type* return_type = get_return_type(f.return_type);
		if (!return_type) {
			fail(FaultTypeMapping, "return type of '%s'", f.full_name);
			return NULL;
		}

		std::vector<llvm::Type*> param_types;
		param_types.reserve(f.params.size() + 1);
		if (requires_access_link) {
			param_types.push_back(llvm::PointerType::getUnqual(parent_frame_type));
		}
		for (FunctionDecl::Parameters::const_iterator it = f.params.begin(); it != f.params.end(); ++it) {
			llvm::Type* type = get_parameter_type(*it);
			if (!type) {
				fail(FaultTypeMapping, "parameter '%s' of '%s'", it->name, f.full_name);
				return NULL;
			}
			param_types.push_back(type);
		}

		return llvm::FunctionType::get(return_type, param_types, false);
	}

	llvm::StructType* Codegen::get_parent_frame_type(const FunctionDecl& f) {
		if (f.parent == NULL) {
			fail(FaultMissingContext, "function '%s' does not have a parent", f.full_name);
			return NULL;
		}
		if (f.parent == &f) return _placeholder_frame_type;
		if (!f.parent->has_frame_type()) {
			fail(FaultMissingContext, "parent '%s' of '%s' does not have a frame type", f.parent->full_name, f.full_name);
			return NULL;
		}
		return f.parent->frame_type();
	}

	llvm::Value* Codegen::get_pointer_to_frame_field(Builder& builder, llvm::StructType* frame_type, llvm::Value* frame, int index, const llvm::Twine& name) {
		return builder.CreateStructGEP(frame_type, frame, index, name);
	}

	llvm::Value* Codegen::get_frame_field(Builder& builder, llvm::StructType* frame_type, llvm::Value* frame, int index, const llvm::Twine& name) {
		llvm::Value* ptr = get_pointer_to_frame_field(builder, frame_type, frame, index, name + ".ptr");
		return builder.CreateLoad(frame_type->getElementType(index), ptr, name);
	}

	llvm::Value* Codegen::get_access_link(Builder& builder, Function& current_function, int levels, llvm::StructType*& out_frame_type) {
		const FunctionDecl* decl = current_function.decl;
		llvm::StructType* frame_type = current_function.frame_type;
		llvm::Value* frame = current_function.frame;

		for (int i = 0; i < levels; ++i) {
			if (decl->is_outermost()) {
				fail(FaultMissingContext, "access link walk of %d levels leaves the outermost frame in '%s'", levels, current_function.decl->full_name);
				return NULL;
			}
			frame = get_frame_field(builder, frame_type, frame, 0, "access_link");
			decl = decl->parent;
			frame_type = decl->frame_type();
		}

		out_frame_type = frame_type;
		return frame;
	}
}
