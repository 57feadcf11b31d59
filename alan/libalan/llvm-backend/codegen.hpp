#pragma once
#ifndef CODEGEN_HPP_5RB0NEUA
#define CODEGEN_HPP_5RB0NEUA

#include "basic.hpp"
#include "symbol.hpp"

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Constants.h>
#include <llvm/IR/Instructions.h>
#include <llvm/IR/IRBuilder.h>
#include <llvm/Support/raw_ostream.h>

#include "alan/ast.hpp"

#include <memory>
#include <string>
#include <vector>

namespace alan {
	typedef llvm::IRBuilder<> Builder;

	struct CompileOptions {
		std::string module_name;
		bool verbose; // progress messages on stderr
		bool dump_ir; // print the verified module to stdout

		CompileOptions() : module_name("alan"), verbose(false), dump_ir(false) {}
	};

	/*
		Per-function compilation state. `frame` is the alloca holding this
		invocation's activation record, whose field 0 is the access link.
	*/
	struct Function {
		FunctionDecl* decl;
		llvm::Function* function;
		llvm::StructType* frame_type;
		llvm::Value* frame;
		llvm::BasicBlock* entry_point;

		Function() : decl(NULL), function(NULL), frame_type(NULL), frame(NULL), entry_point(NULL) {}
		operator llvm::Function*() const { return function; }
	};

	class Codegen {
	public:
		Codegen(llvm::LLVMContext& context, const CompileOptions& options = CompileOptions());
		~Codegen();

		/*
			Compiles the whole program rooted at the outermost function, then
			verifies the module. Returns false on the first fault; the reason is
			available from get_error_string() and the module must not be used.
		*/
		bool compile_program(FunctionDecl* program);

		llvm::Module* get_module() const { return _module.get(); }
		std::unique_ptr<llvm::Module> release_module() { return std::move(_module); }
		const char* get_error_string() const { return _error_string; }
		const SymbolTable& symbols() const { return _symbols; }
		llvm::StructType* get_placeholder_frame_type() const { return _placeholder_frame_type; }

		// Type mapping and frame layout, exposed for inspection.
		llvm::Type* get_value_type(const Type& type);
		llvm::Type* get_return_type(const Type& type);
		llvm::Type* get_parameter_type(const Parameter& param);
		llvm::StructType* build_frame_type(const FunctionDecl& f, llvm::StructType* parent_frame_type);
	private:
		enum FaultKind {
			FaultTypeMapping,
			FaultMissingContext,
			FaultUnresolvedCallee,
			FaultTypeMismatch,
			FaultMissingReturn,
			FaultMalformedTree,
			FaultInvalidModule
		};

		// runtime support
		bool declare_runtime();
		llvm::Function* declare_primitive(const char* name, llvm::Type* return_type, const std::vector<llvm::Type*>& param_types, const std::vector<PassMode>& param_modes);
		llvm::Function* define_primitive(const char* name, llvm::Type* return_type, const std::vector<llvm::Type*>& param_types, Builder& builder);

		// functions
		llvm::FunctionType* get_function_type(const FunctionDecl& f, llvm::StructType* parent_frame_type, bool requires_access_link);
		llvm::StructType* get_parent_frame_type(const FunctionDecl& f);
		bool declare_function(FunctionDecl& f);
		bool compile_function(FunctionDecl& f);
		bool compile_function_body(Function& function);

		// statements -- out_terminal is set when control cannot fall through
		bool compile_statement(Builder& builder, const ASTNode* node, Function& current_function, bool& out_terminal);
		bool compile_sequence(Builder& builder, const ASTNode* seq, Function& current_function, bool& out_terminal);
		bool compile_if_else(Builder& builder, const ASTNode* node, Function& current_function);
		bool compile_loop(Builder& builder, const ASTNode* node, Function& current_function);

		// expressions
		llvm::Value* compile_expression(Builder& builder, const ASTNode* node, Function& current_function);
		llvm::Value* compile_binary(Builder& builder, const ASTNode* node, Function& current_function);
		llvm::Value* compile_lvalue(Builder& builder, const ASTNode* node, Function& current_function);
		llvm::Value* compile_condition(Builder& builder, const ASTNode* node, Function& current_function);
		llvm::Value* compile_short_circuit(Builder& builder, const ASTNode* node, Function& current_function);
		llvm::Value* compile_call(Builder& builder, const ASTNode* node, Function& current_function);

		/*
			get_access_link usage:

			frame = the frame of current_function
			levels = the number of access links to follow (0 returns frame itself)
			out_frame_type = the type of the frame that was reached

			returns NULL if the walk leaves the outermost frame
		*/
		llvm::Value* get_access_link(Builder& builder, Function& current_function, int levels, llvm::StructType*& out_frame_type);
		llvm::Value* get_frame_field(Builder& builder, llvm::StructType* frame_type, llvm::Value* frame, int index, const llvm::Twine& name);
		llvm::Value* get_pointer_to_frame_field(Builder& builder, llvm::StructType* frame_type, llvm::Value* frame, int index, const llvm::Twine& name);

		llvm::IntegerType* get_int_type() const { return llvm::Type::getInt16Ty(_context); }
		llvm::IntegerType* get_byte_type() const { return llvm::Type::getInt8Ty(_context); }
		llvm::PointerType* get_string_type() const { return llvm::Type::getInt8PtrTy(_context); }

		bool fail(FaultKind kind, const char* fmt, ...) __attribute__((format(printf, 3, 4)));
		void progress(const char* fmt, ...) __attribute__((format(printf, 2, 3)));

		llvm::LLVMContext& _context;
		std::unique_ptr<llvm::Module> _module;
		CompileOptions _options;
		char* _error_string;
		SymbolTable _symbols;
		llvm::StructType* _placeholder_frame_type;
		const FunctionDecl* _current_decl; // for diagnostics
	};
}

#endif /* end of include guard: CODEGEN_HPP_5RB0NEUA */
