#include "codegen.hpp"

#include <llvm/IR/Verifier.h>
#include <llvm/IR/CFG.h>

#include <stdlib.h>

namespace {
	// Keeps blocks in the order their code is generated.
	void move_to_end(llvm::BasicBlock* bb) {
		llvm::Function* F = bb->getParent();
		if (&F->back() != bb) bb->moveAfter(&F->back());
	}
}

namespace alan {
	Codegen::Codegen(llvm::LLVMContext& context, const CompileOptions& options) :
		_context(context),
		_options(options),
		_error_string(NULL),
		_placeholder_frame_type(NULL),
		_current_decl(NULL)
	{
		_module.reset(new llvm::Module(options.module_name, context));
		// The outermost function has no real parent; its access link points to this.
		_placeholder_frame_type = llvm::StructType::create(context, "frame.placeholder");
	}

	Codegen::~Codegen() {
		free(_error_string);
	}

	bool Codegen::fail(FaultKind kind, const char* fmt, ...) {
		static const char* kind_names[] = {
			"TYPE MAPPING",
			"MISSING CONTEXT",
			"UNRESOLVED CALLEE",
			"TYPE MISMATCH",
			"MISSING RETURN",
			"MALFORMED TREE",
			"INVALID MODULE"
		};

		va_list ap;
		va_start(ap, fmt);
		char* message = vformat_string(fmt, ap);
		va_end(ap);

		if (!_error_string) {
			const char* where = _current_decl ? _current_decl->full_name : "<program>";
			_error_string = format_string("%s: %s (in function '%s')", kind_names[kind], message ? message : fmt, where);
		} else {
			// The first fault is the cause, later ones describe where it surfaced.
			char* chained = format_string("%s\n\tin %s", _error_string, message ? message : fmt);
			free(_error_string);
			_error_string = chained;
		}
		free(message);
		return false;
	}

	void Codegen::progress(const char* fmt, ...) {
		if (!_options.verbose) return;
		va_list ap;
		va_start(ap, fmt);
		vfprintf(stderr, fmt, ap);
		va_end(ap);
		fputc('\n', stderr);
	}

	bool Codegen::compile_program(FunctionDecl* program) {
		ASSERT(_module != NULL);

		if (!program) return fail(FaultMissingContext, "no program to compile");
		if (program->parent != NULL && program->parent != program) {
			return fail(FaultMissingContext, "outermost function '%s' has a parent", program->full_name);
		}

		progress("Declaring runtime...");
		if (!declare_runtime()) return false;

		// The outermost function is its own parent.
		program->parent = program;
		if (!declare_function(*program)) return false;
		if (!compile_function(*program)) return false;
		_current_decl = NULL;

		progress("Verifying module...");
		std::string error;
		llvm::raw_string_ostream os(error);
		if (llvm::verifyModule(*_module, &os)) {
			os.flush();
			return fail(FaultInvalidModule, "%s", error.c_str());
		}

		if (_options.dump_ir) {
			_module->print(llvm::outs(), NULL);
		}
		return true;
	}

	bool Codegen::declare_function(FunctionDecl& f) {
		_current_decl = &f;

		llvm::StructType* parent_frame_type = get_parent_frame_type(f);
		if (!parent_frame_type) return false;

		bool requires_access_link = !f.is_outermost();
		llvm::FunctionType* function_type = get_function_type(f, parent_frame_type, requires_access_link);
		if (!function_type) return false;

		if (_symbols.find(f.full_name)) {
			return fail(FaultMissingContext, "function '%s' is declared twice", f.full_name);
		}

		llvm::GlobalValue::LinkageTypes linkage = f.is_outermost() ? llvm::GlobalValue::ExternalLinkage : llvm::GlobalValue::InternalLinkage;
		llvm::Function* F = llvm::Function::Create(function_type, linkage, f.full_name, _module.get());

		llvm::Function::arg_iterator arg_it = F->arg_begin();
		if (requires_access_link) (arg_it++)->setName("access_link");
		for (size_t i = 0; i < f.params.size(); ++i) {
			(arg_it++)->setName(f.params[i].name);
		}

		llvm::StructType* frame_type = build_frame_type(f, parent_frame_type);
		if (!frame_type) return false;
		if (!f.set_frame_type(frame_type)) {
			return fail(FaultMissingContext, "frame type of '%s' was already computed", f.full_name);
		}

		FunctionSymbol symbol;
		symbol.full_name = f.full_name;
		symbol.function = F;
		symbol.depth = f.depth;
		symbol.requires_access_link = requires_access_link;
		symbol.param_modes.reserve(f.params.size());
		for (size_t i = 0; i < f.params.size(); ++i) {
			// arrays are always passed by reference
			const Parameter& p = f.params[i];
			symbol.param_modes.push_back(p.type.is_array() ? PassByReference : p.pass);
		}
		if (!_symbols.declare(symbol)) {
			return fail(FaultMissingContext, "could not register '%s'", f.full_name);
		}
		return true;
	}

	bool Codegen::compile_function(FunctionDecl& f) {
		// Declare all nested functions before compiling any of them, so that
		// siblings can call each other regardless of declaration order.
		for (FunctionDecl::Locals::iterator it = f.locals.begin(); it != f.locals.end(); ++it) {
			if (it->kind != LocalDecl::Function) continue;
			if (it->function->parent != &f) {
				_current_decl = &f;
				return fail(FaultMissingContext, "nested function '%s' does not name '%s' as its parent", it->function->full_name, f.full_name);
			}
			if (!declare_function(*it->function)) return false;
		}
		for (FunctionDecl::Locals::iterator it = f.locals.begin(); it != f.locals.end(); ++it) {
			if (it->kind != LocalDecl::Function) continue;
			if (!compile_function(*it->function)) return false;
		}

		_current_decl = &f;
		progress("Compiling %s...", f.full_name);

		const FunctionSymbol* symbol = _symbols.find(f.full_name);
		ASSERT(symbol != NULL);

		Function function;
		function.decl = &f;
		function.function = symbol->function;
		function.frame_type = f.frame_type();
		return compile_function_body(function);
	}

	bool Codegen::compile_function_body(Function& function) {
		llvm::Function* F = function.function;
		const FunctionDecl& decl = *function.decl;

		llvm::BasicBlock* entry_bb = llvm::BasicBlock::Create(_context, "entry", F);
		function.entry_point = entry_bb;
		Builder builder(entry_bb);

		function.frame = builder.CreateAlloca(function.frame_type, NULL, "frame");

		// Incoming arguments line up with the frame: the access link (if any)
		// goes to field 0, the declared parameters follow in order.
		unsigned index = 0;
		if (decl.is_outermost()) {
			llvm::PointerType* link_type = llvm::cast<llvm::PointerType>(function.frame_type->getElementType(0));
			builder.CreateStore(llvm::ConstantPointerNull::get(link_type), get_pointer_to_frame_field(builder, function.frame_type, function.frame, 0, "access_link.ptr"));
			index = 1;
		}
		for (llvm::Function::arg_iterator it = F->arg_begin(); it != F->arg_end(); ++it, ++index) {
			llvm::Value* field = get_pointer_to_frame_field(builder, function.frame_type, function.frame, index, it->getName() + ".ptr");
			builder.CreateStore(&*it, field);
		}

		bool terminal = false;
		if (!compile_sequence(builder, decl.body, function, terminal)) return false;

		if (!terminal) {
			llvm::BasicBlock* last_bb = builder.GetInsertBlock();
			if (decl.return_type == TypeProc) {
				builder.CreateRetVoid();
			} else if (last_bb != entry_bb && llvm::pred_empty(last_bb)) {
				// e.g. the merge block of an if whose arms both return
				builder.CreateUnreachable();
			} else {
				return fail(FaultMissingReturn, "control reaches the end of '%s', which returns %s", decl.full_name, type_kind_name(decl.return_type.kind));
			}
		}
		return true;
	}

	bool Codegen::compile_sequence(Builder& builder, const ASTNode* seq, Function& current_function, bool& out_terminal) {
		if (!seq) return fail(FaultMalformedTree, "missing statement list");
		ASSERT(seq->type == ASTNodeTypeSequence);

		bool terminal = false;
		bool block_closed = false;
		for (const ASTNode* x = seq->sequence.head; x; x = x->next) {
			if (block_closed) {
				// Statements after a return are still emitted, into a block nothing branches to.
				llvm::BasicBlock* dead_bb = llvm::BasicBlock::Create(_context, "dead", current_function.function);
				builder.SetInsertPoint(dead_bb);
				block_closed = false;
			}
			bool statement_terminal = false;
			if (!compile_statement(builder, x, current_function, statement_terminal)) return false;
			if (statement_terminal) {
				terminal = true;
				block_closed = true;
			}
		}

		if (terminal && !block_closed) {
			builder.CreateUnreachable();
		}
		out_terminal = terminal;
		return true;
	}

	bool Codegen::compile_statement(Builder& builder, const ASTNode* node, Function& current_function, bool& out_terminal) {
		out_terminal = false;

		switch (node->type) {
			case ASTNodeTypeEmpty:
				return true;
			case ASTNodeTypeSequence:
				return compile_sequence(builder, node, current_function, out_terminal);
			case ASTNodeTypeAssign: {
				llvm::Value* value = compile_expression(builder, node->assign.value, current_function);
				if (!value) return false;
				llvm::Value* target = compile_lvalue(builder, node->assign.target, current_function);
				if (!target) return false;
				builder.CreateStore(value, target);
				return true;
			}
			case ASTNodeTypeCall: {
				// procedure call, any result is discarded
				return compile_call(builder, node, current_function) != NULL;
			}
			case ASTNodeTypeIfElse:
				return compile_if_else(builder, node, current_function);
			case ASTNodeTypeLoop:
				return compile_loop(builder, node, current_function);
			case ASTNodeTypeReturn: {
				if (node->return_expr.value) {
					llvm::Value* result = compile_expression(builder, node->return_expr.value, current_function);
					if (!result) return false;
					builder.CreateRet(result);
				} else {
					builder.CreateRetVoid();
				}
				out_terminal = true;
				return true;
			}
			default:
				return fail(FaultMalformedTree, "inappropriate AST node in statement position (type %d)", node->type);
		}
	}

	bool Codegen::compile_if_else(Builder& builder, const ASTNode* node, Function& current_function) {
		llvm::Value* cond = compile_condition(builder, node->if_else.cond, current_function);
		if (!cond) return false;

		llvm::Function* F = current_function.function;
		llvm::BasicBlock* then_bb = llvm::BasicBlock::Create(_context, "then", F);
		llvm::BasicBlock* else_bb = node->if_else.else_body ? llvm::BasicBlock::Create(_context, "else", F) : NULL;
		llvm::BasicBlock* merge_bb = llvm::BasicBlock::Create(_context, "ifcont", F);

		builder.CreateCondBr(cond, then_bb, else_bb ? else_bb : merge_bb);

		builder.SetInsertPoint(then_bb);
		bool then_terminal = false;
		if (!compile_statement(builder, node->if_else.body, current_function, then_terminal)) return false;
		// compiling 'then' can change the current block
		if (!then_terminal) builder.CreateBr(merge_bb);

		if (else_bb) {
			move_to_end(else_bb);
			builder.SetInsertPoint(else_bb);
			bool else_terminal = false;
			if (!compile_statement(builder, node->if_else.else_body, current_function, else_terminal)) return false;
			if (!else_terminal) builder.CreateBr(merge_bb);
		}

		// TODO: report the if as terminal when both arms are, so the merge block is not emitted at all.
		move_to_end(merge_bb);
		builder.SetInsertPoint(merge_bb);
		return true;
	}

	bool Codegen::compile_loop(Builder& builder, const ASTNode* node, Function& current_function) {
		llvm::Function* F = current_function.function;
		llvm::BasicBlock* while_bb = llvm::BasicBlock::Create(_context, "while", F);
		llvm::BasicBlock* do_bb = llvm::BasicBlock::Create(_context, "do", F);
		llvm::BasicBlock* merge_bb = llvm::BasicBlock::Create(_context, "continue", F);

		builder.CreateBr(while_bb);

		builder.SetInsertPoint(while_bb);
		llvm::Value* cond = compile_condition(builder, node->loop.cond, current_function);
		if (!cond) return false;
		builder.CreateCondBr(cond, do_bb, merge_bb);

		builder.SetInsertPoint(do_bb);
		bool body_terminal = false;
		if (!compile_statement(builder, node->loop.body, current_function, body_terminal)) return false;
		if (!body_terminal) builder.CreateBr(while_bb);

		move_to_end(merge_bb);
		builder.SetInsertPoint(merge_bb);
		return true;
	}
}
