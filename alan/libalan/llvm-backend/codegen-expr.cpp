#include "codegen.hpp"

namespace {
	bool is_signed_type(const alan::Type& type) {
		return type == alan::TypeInt;
	}

	llvm::CmpInst::Predicate get_compare_predicate(alan::CompareOperator op, bool is_signed) {
		switch (op) {
			case alan::CmpEq: return llvm::CmpInst::ICMP_EQ;
			case alan::CmpNe: return llvm::CmpInst::ICMP_NE;
			case alan::CmpLt: return is_signed ? llvm::CmpInst::ICMP_SLT : llvm::CmpInst::ICMP_ULT;
			case alan::CmpGt: return is_signed ? llvm::CmpInst::ICMP_SGT : llvm::CmpInst::ICMP_UGT;
			case alan::CmpLe: return is_signed ? llvm::CmpInst::ICMP_SLE : llvm::CmpInst::ICMP_ULE;
			case alan::CmpGe: return is_signed ? llvm::CmpInst::ICMP_SGE : llvm::CmpInst::ICMP_UGE;
		}
		return llvm::CmpInst::BAD_ICMP_PREDICATE;
	}
}

namespace alan {
	llvm::Value* Codegen::compile_expression(Builder& builder, const ASTNode* node, Function& current_function) {
		if (!node) {
			fail(FaultMalformedTree, "missing expression");
			return NULL;
		}

		switch (node->type) {
			case ASTNodeTypeIntLiteral:
				return llvm::ConstantInt::get(get_int_type(), node->int_literal.value, true);
			case ASTNodeTypeCharLiteral:
				return llvm::ConstantInt::get(get_byte_type(), node->char_literal.value);
			case ASTNodeTypeValue: {
				const ASTNode* lvalue = node->value.lvalue;
				llvm::Value* address = compile_lvalue(builder, lvalue, current_function);
				if (!address) return NULL;
				// A whole array is already an address, there is nothing to load.
				if (node->value_type.is_array()) return address;
				llvm::Type* type = get_value_type(node->value_type);
				if (!type) return NULL;
				return builder.CreateLoad(type, address, lvalue->type == ASTNodeTypeIdentifier ? lvalue->identifier.name : "value");
			}
			case ASTNodeTypeCall: {
				if (node->value_type == TypeProc) {
					fail(FaultTypeMismatch, "procedure '%s' used as a value", node->call.callee);
					return NULL;
				}
				return compile_call(builder, node, current_function);
			}
			case ASTNodeTypeSign: {
				llvm::Value* operand = compile_expression(builder, node->sign.expr, current_function);
				if (!operand) return NULL;
				if (node->sign.sign == SignPlus) return operand;
				return builder.CreateNeg(operand, "neg");
			}
			case ASTNodeTypeBinary:
				return compile_binary(builder, node, current_function);
			default:
				fail(FaultMalformedTree, "inappropriate AST node in expression position (type %d)", node->type);
				return NULL;
		}
	}

	llvm::Value* Codegen::compile_binary(Builder& builder, const ASTNode* node, Function& current_function) {
		const ASTNode* left = node->binary.left;
		const ASTNode* right = node->binary.right;

		llvm::Value* a = compile_expression(builder, left, current_function);
		if (!a) return NULL;
		llvm::Value* b = compile_expression(builder, right, current_function);
		if (!b) return NULL;

		switch (node->binary.op) {
			case OpAdd: return builder.CreateAdd(a, b, "add");
			case OpSub: return builder.CreateSub(a, b, "sub");
			case OpMul: return builder.CreateMul(a, b, "mul");
			case OpDiv:
			case OpMod: {
				// int is signed, byte is unsigned
				bool is_div = node->binary.op == OpDiv;
				if (left->value_type == TypeInt && right->value_type == TypeInt) {
					return is_div ? builder.CreateSDiv(a, b, "sdiv") : builder.CreateSRem(a, b, "smod");
				}
				if (left->value_type == TypeByte && right->value_type == TypeByte) {
					return is_div ? builder.CreateUDiv(a, b, "udiv") : builder.CreateURem(a, b, "umod");
				}
				fail(FaultTypeMismatch, "%s of %s by %s", is_div ? "division" : "modulo", type_kind_name(left->value_type.kind), type_kind_name(right->value_type.kind));
				return NULL;
			}
		}
		fail(FaultMalformedTree, "unknown binary operator %d", node->binary.op);
		return NULL;
	}

	/*
		Returns the address of the variable (or array element) named by the
		lvalue. For a whole array this is a pointer to its first element.
	*/
	llvm::Value* Codegen::compile_lvalue(Builder& builder, const ASTNode* node, Function& current_function) {
		if (!node) {
			fail(FaultMalformedTree, "missing lvalue");
			return NULL;
		}

		if (node->type == ASTNodeTypeStringLiteral) {
			return builder.CreateGlobalStringPtr(node->string_literal.data, "str");
		}
		if (node->type != ASTNodeTypeIdentifier) {
			fail(FaultMalformedTree, "inappropriate AST node in lvalue position (type %d)", node->type);
			return NULL;
		}

		const char* name = node->identifier.name;
		const Type& type = node->value_type;
		int offset = node->identifier.offset;
		if (node->identifier.nesting_diff < 0) {
			fail(FaultMalformedTree, "identifier '%s' has a negative nesting difference (%d)", name, node->identifier.nesting_diff);
			return NULL;
		}

		llvm::StructType* frame_type = NULL;
		llvm::Value* frame = get_access_link(builder, current_function, node->identifier.nesting_diff, frame_type);
		if (!frame) {
			fail(FaultMissingContext, "identifier '%s'", name);
			return NULL;
		}
		if (offset < 1 || (unsigned)offset >= frame_type->getNumElements()) {
			fail(FaultMalformedTree, "identifier '%s' refers to field %d of %s, which has %u fields", name, offset, frame_type->getName().str().c_str(), frame_type->getNumElements());
			return NULL;
		}

		llvm::Value* base = NULL;
		if (node->identifier.is_parameter) {
			if (type.is_array() || node->identifier.is_reference) {
				// the frame holds a pointer to the caller's storage
				base = get_frame_field(builder, frame_type, frame, offset, name);
			} else {
				base = get_pointer_to_frame_field(builder, frame_type, frame, offset, name);
			}
		} else {
			base = get_pointer_to_frame_field(builder, frame_type, frame, offset, name);
			if (type.is_array()) {
				// the array is stored inline, decay it to a pointer to its first element
				llvm::Type* array_type = frame_type->getElementType(offset);
				base = builder.CreateConstInBoundsGEP2_32(array_type, base, 0, 0, name);
			}
		}

		const ASTNode* subscript = node->identifier.subscript;
		if (!subscript) return base;

		if (!type.is_array()) {
			fail(FaultTypeMismatch, "subscript on '%s', which is %s", name, type_kind_name(type.kind));
			return NULL;
		}
		llvm::Type* element_type = get_value_type(type.element_type());
		if (!element_type) return NULL;
		llvm::Value* index = compile_expression(builder, subscript, current_function);
		if (!index) return NULL;
		// no bounds checking
		llvm::Type* index_type = builder.getInt64Ty();
		index = is_signed_type(subscript->value_type) ? builder.CreateSExt(index, index_type) : builder.CreateZExt(index, index_type);
		return builder.CreateGEP(element_type, base, index, llvm::Twine(name) + ".elem");
	}

	llvm::Value* Codegen::compile_condition(Builder& builder, const ASTNode* node, Function& current_function) {
		if (!node) {
			fail(FaultMalformedTree, "missing condition");
			return NULL;
		}

		switch (node->type) {
			case ASTNodeTypeTrue:  return builder.getTrue();
			case ASTNodeTypeFalse: return builder.getFalse();
			case ASTNodeTypeNot: {
				llvm::Value* operand = compile_condition(builder, node->logic_not.cond, current_function);
				if (!operand) return NULL;
				return builder.CreateNot(operand, "not");
			}
			case ASTNodeTypeCompare: {
				const ASTNode* left = node->compare.left;
				const ASTNode* right = node->compare.right;
				if (!left || !right || !left->value_type.is_scalar() || left->value_type != right->value_type) {
					fail(FaultTypeMismatch, "comparison of %s with %s",
						left ? type_kind_name(left->value_type.kind) : "<nothing>",
						right ? type_kind_name(right->value_type.kind) : "<nothing>");
					return NULL;
				}
				llvm::Value* a = compile_expression(builder, left, current_function);
				if (!a) return NULL;
				llvm::Value* b = compile_expression(builder, right, current_function);
				if (!b) return NULL;
				return builder.CreateICmp(get_compare_predicate(node->compare.op, is_signed_type(left->value_type)), a, b, "icmp");
			}
			case ASTNodeTypeAnd:
			case ASTNodeTypeOr:
				return compile_short_circuit(builder, node, current_function);
			default:
				fail(FaultMalformedTree, "inappropriate AST node in condition position (type %d)", node->type);
				return NULL;
		}
	}

	/*
		a and b:  a ? (a & b) : a
		a or b:   a ? a : (a | b)
		The second operand is only evaluated on the path through the middle block.
	*/
	llvm::Value* Codegen::compile_short_circuit(Builder& builder, const ASTNode* node, Function& current_function) {
		bool is_and = node->type == ASTNodeTypeAnd;
		llvm::Function* F = current_function.function;

		llvm::Value* left = compile_condition(builder, node->logic_and.left, current_function);
		if (!left) return NULL;
		llvm::BasicBlock* left_bb = builder.GetInsertBlock(); // compiling the left side can change the current block

		llvm::BasicBlock* middle_bb = llvm::BasicBlock::Create(_context, is_and ? "and_middle" : "or_middle", F);
		llvm::BasicBlock* merge_bb = llvm::BasicBlock::Create(_context, is_and ? "and_merge" : "or_merge", F);

		if (is_and) builder.CreateCondBr(left, middle_bb, merge_bb);
		else        builder.CreateCondBr(left, merge_bb, middle_bb);

		builder.SetInsertPoint(middle_bb);
		llvm::Value* right = compile_condition(builder, node->logic_and.right, current_function);
		if (!right) return NULL;
		llvm::Value* combined = is_and ? builder.CreateAnd(left, right, "and") : builder.CreateOr(left, right, "or");
		builder.CreateBr(merge_bb);
		llvm::BasicBlock* middle_end_bb = builder.GetInsertBlock();

		if (&F->back() != merge_bb) merge_bb->moveAfter(&F->back());
		builder.SetInsertPoint(merge_bb);
		llvm::PHINode* phi = builder.CreatePHI(builder.getInt1Ty(), 2, "phi");
		phi->addIncoming(left, left_bb);
		phi->addIncoming(combined, middle_end_bb);
		return phi;
	}

	llvm::Value* Codegen::compile_call(Builder& builder, const ASTNode* node, Function& current_function) {
		const char* callee_name = node->call.callee;
		const FunctionSymbol* callee = callee_name ? _symbols.find(callee_name) : NULL;
		if (!callee) {
			fail(FaultUnresolvedCallee, "function '%s' not found", callee_name ? callee_name : "<unnamed>");
			return NULL;
		}

		const ASTNode* args = node->call.args;
		size_t num_args = args ? args->sequence.length : 0;
		if (num_args != callee->param_modes.size()) {
			fail(FaultUnresolvedCallee, "'%s' takes %zu arguments, %zu given", callee_name, callee->param_modes.size(), num_args);
			return NULL;
		}

		std::vector<llvm::Value*> values;
		values.reserve(num_args + 1);
		if (callee->requires_access_link) values.push_back(NULL); // filled in below

		// arguments are evaluated left to right
		size_t i = 0;
		for (const ASTNode* x = args ? args->sequence.head : NULL; x; x = x->next, ++i) {
			llvm::Value* value = NULL;
			if (callee->param_modes[i] == PassByReference) {
				if (x->type != ASTNodeTypeValue) {
					fail(FaultTypeMismatch, "argument %zu of '%s' is passed by reference but is not a variable", i + 1, callee_name);
					return NULL;
				}
				value = compile_lvalue(builder, x->value.lvalue, current_function);
			} else {
				value = compile_expression(builder, x, current_function);
			}
			if (!value) return NULL;
			values.push_back(value);
		}

		llvm::Function* F = callee->function;
		if (callee->requires_access_link) {
			// The callee's access link is the frame of its static parent.
			int levels = node->call.caller_depth - node->call.callee_depth + 1;
			if (levels < 0) {
				fail(FaultMissingContext, "'%s' at depth %d is not visible from depth %d", callee_name, node->call.callee_depth, node->call.caller_depth);
				return NULL;
			}
			llvm::StructType* frame_type = NULL;
			llvm::Value* link = get_access_link(builder, current_function, levels, frame_type);
			if (!link) {
				fail(FaultMissingContext, "access link for call to '%s'", callee_name);
				return NULL;
			}
			if (link->getType() != F->getFunctionType()->getParamType(0)) {
				fail(FaultMissingContext, "access link for call to '%s' reaches %s", callee_name, frame_type->getName().str().c_str());
				return NULL;
			}
			values[0] = link;
		}

		for (size_t j = 0; j < values.size(); ++j) {
			if (values[j]->getType() != F->getFunctionType()->getParamType(j)) {
				fail(FaultTypeMismatch, "argument %zu of '%s' has the wrong type", callee->requires_access_link ? j : j + 1, callee_name);
				return NULL;
			}
		}

		// void calls cannot be named
		const char* name = F->getReturnType()->isVoidTy() ? "" : "call";
		return builder.CreateCall(F->getFunctionType(), F, values, name);
	}
}
