#include "test.hpp"
#include "symbol.hpp"
#include "llvm-backend/codegen.hpp"

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/DerivedTypes.h>
#include <llvm/IR/Function.h>

namespace {
	bool starts_with(const char* str, const char* prefix) {
		return str && strncmp(str, prefix, strlen(prefix)) == 0;
	}
}

BEGIN_TESTS()

BEGIN_GROUP("Declarations")

STORY("nested functions get dotted names and increasing depth", {
	AST ast;
	FunctionDecl* prog = ast.program("main");
	FunctionDecl* f = ast.function(prog, "f");
	FunctionDecl* g = ast.function(f, "g", Type::Int());
	TEST_EQ(std::string(g->full_name), "main.f.g");
	TEST_EQ(g->depth, 2);
	TEST_EQ(g->parent, f);
	TEST(prog->is_outermost());
	TEST(!g->is_outermost());
});

STORY("nested functions are not counted as local variables", {
	AST ast;
	FunctionDecl* prog = ast.program("main");
	ast.variable(prog, "x", Type::Int());
	ast.function(prog, "f");
	ast.variable(prog, "buf", Type::Array(TypeByte, 4));
	TEST_EQ(prog->locals.size(), 3u);
	TEST_EQ(prog->num_local_variables(), 2u);
});

STORY("the frame type is assigned once", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	llvm::StructType* a = llvm::StructType::create(context, "a");
	llvm::StructType* b = llvm::StructType::create(context, "b");
	TEST(!prog->has_frame_type());
	TEST(prog->set_frame_type(a));
	TEST(!prog->set_frame_type(b));
	TEST_EQ(prog->frame_type(), a);
});

STORY("print dumps declarations and the body with indentation", {
	AST ast;
	FunctionDecl* prog = ast.program("main");
	ast.variable(prog, "x", Type::Int());
	FunctionDecl* f = ast.function(prog, "f", Type::Byte());
	ast.parameter(f, "n", Type::Int(), PassByReference);
	ast.sequence_push(f->body, ast.return_(ast.char_literal(65)));
	ast.sequence_push(prog->body, ast.assign(ast.identifier("x", Type::Int(), 0, 1, false), ast.int_literal(42)));

	OutputCapture capture(stdout);
	ast.print();
	std::string out = capture.finish();

	TEST_EQ(out.find("FUNCTION main (depth 0) : proc\n"), (size_t)0);
	TEST(out.find("\n VAR x : int\n") != std::string::npos);
	TEST(out.find("\n FUNCTION main.f (depth 1) : byte\n") != std::string::npos);
	TEST(out.find("\n  PARAM n : int (reference)\n") != std::string::npos);
	TEST(out.find("RETURN:\n") != std::string::npos);
	TEST(out.find("CHAR: 65\n") != std::string::npos);
	TEST(out.find("IDENTIFIER: x (diff 0, offset 1, local)\n") != std::string::npos);
	TEST(out.find("INT: 42\n") != std::string::npos);
	TEST(out.find("main.f") < out.find("INT: 42"));
});

STORY("print of an empty tree says so", {
	AST ast;
	OutputCapture capture(stdout);
	ast.print();
	TEST_EQ(capture.finish(), "<NULL>\n");
});

END_GROUP()

BEGIN_GROUP("Type mapping")

STORY("scalars map to fixed-width integers", {
	llvm::LLVMContext context;
	Codegen codegen(context);
	TEST_EQ(codegen.get_value_type(Type::Int()), llvm::Type::getInt16Ty(context));
	TEST_EQ(codegen.get_value_type(Type::Byte()), llvm::Type::getInt8Ty(context));
	TEST_EQ(codegen.get_return_type(Type::Proc()), llvm::Type::getVoidTy(context));
	TEST_EQ(codegen.get_value_type(Type::Array(TypeInt, 8)), llvm::ArrayType::get(llvm::Type::getInt16Ty(context), 8));
});

STORY("parameters passed by reference and arrays become pointers", {
	llvm::LLVMContext context;
	Codegen codegen(context);
	Parameter by_value = { "a", Type::Int(), PassByValue };
	Parameter by_reference = { "b", Type::Int(), PassByReference };
	Parameter array = { "c", Type::Array(TypeByte, 0), PassByValue };
	TEST_EQ(codegen.get_parameter_type(by_value), llvm::Type::getInt16Ty(context));
	TEST_EQ(codegen.get_parameter_type(by_reference), llvm::PointerType::getUnqual(llvm::Type::getInt16Ty(context)));
	TEST_EQ(codegen.get_parameter_type(array), llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(context)));
});

STORY("proc is not a value type", {
	llvm::LLVMContext context;
	Codegen codegen(context);
	TEST_EQ(codegen.get_value_type(Type::Proc()), (llvm::Type*)NULL);
	TEST(starts_with(codegen.get_error_string(), "TYPE MAPPING"));
});

STORY("a local of no mappable type aborts compilation", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	ast.variable(prog, "x", Type::None());
	Codegen codegen(context);
	TEST(!codegen.compile_program(prog));
	TEST(starts_with(codegen.get_error_string(), "TYPE MAPPING"));
	TEST(strstr(codegen.get_error_string(), "'x'") != NULL);
});

STORY("arrays of arrays have no mapping", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	FunctionDecl* f = ast.function(prog, "f");
	ast.parameter(f, "m", Type::Array(TypeArray, 3));
	Codegen codegen(context);
	TEST(!codegen.compile_program(prog));
	TEST(starts_with(codegen.get_error_string(), "TYPE MAPPING"));
	TEST(strstr(codegen.get_error_string(), "(in function 'main.f')") != NULL);
});

STORY("functions cannot return arrays", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	ast.function(prog, "f", Type::Array(TypeInt, 2));
	Codegen codegen(context);
	TEST(!codegen.compile_program(prog));
	TEST(starts_with(codegen.get_error_string(), "TYPE MAPPING"));
});

END_GROUP()

BEGIN_GROUP("Frame layout")

STORY("the access link comes first, then parameters, then local variables", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	FunctionDecl* f = ast.function(prog, "f");
	ast.parameter(f, "a", Type::Int());
	ast.parameter(f, "b", Type::Int(), PassByReference);
	ast.parameter(f, "c", Type::Array(TypeInt, 0));
	ast.variable(f, "x", Type::Int());
	ast.function(f, "g");
	ast.variable(f, "buf", Type::Array(TypeByte, 10));

	Codegen codegen(context);
	TEST(codegen.compile_program(prog));

	llvm::StructType* frame = f->frame_type();
	TEST_NEQ(frame, (llvm::StructType*)NULL);
	TEST_EQ(frame->getName().str(), "frame.main.f");
	TEST_EQ(frame->getNumElements(), 6u);

	llvm::Type* i16 = llvm::Type::getInt16Ty(context);
	llvm::Type* i8 = llvm::Type::getInt8Ty(context);
	TEST_EQ(frame->getElementType(0), llvm::PointerType::getUnqual(prog->frame_type()));
	TEST_EQ(frame->getElementType(1), i16);
	TEST_EQ(frame->getElementType(2), llvm::PointerType::getUnqual(i16));
	TEST_EQ(frame->getElementType(3), llvm::PointerType::getUnqual(i16));
	TEST_EQ(frame->getElementType(4), i16);
	TEST_EQ(frame->getElementType(5), llvm::ArrayType::get(i8, 10));
});

STORY("the outermost frame links to an opaque placeholder", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	ast.variable(prog, "x", Type::Int());

	Codegen codegen(context);
	TEST(codegen.compile_program(prog));
	TEST_EQ(prog->parent, prog);

	llvm::StructType* placeholder = codegen.get_placeholder_frame_type();
	TEST(placeholder->isOpaque());
	TEST_EQ(prog->frame_type()->getNumElements(), 2u);
	TEST_EQ(prog->frame_type()->getElementType(0), llvm::PointerType::getUnqual(placeholder));
	TEST_EQ(codegen.get_module()->getFunction("main")->arg_size(), 0u);
});

STORY("nested functions take the parent frame as a hidden first argument", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	FunctionDecl* f = ast.function(prog, "f", Type::Byte());
	ast.parameter(f, "a", Type::Int());
	ast.parameter(f, "b", Type::Byte(), PassByReference);
	ast.sequence_push(f->body, ast.return_(ast.char_literal('x')));

	Codegen codegen(context);
	TEST(codegen.compile_program(prog));

	llvm::Function* F = codegen.get_module()->getFunction("main.f");
	TEST_NEQ(F, (llvm::Function*)NULL);
	TEST_EQ(F->arg_size(), 3u);
	TEST_EQ(F->getArg(0)->getName().str(), "access_link");
	TEST_EQ(F->getArg(0)->getType(), llvm::PointerType::getUnqual(prog->frame_type()));
	TEST_EQ(F->getArg(1)->getName().str(), "a");
	TEST_EQ(F->getArg(2)->getType(), llvm::PointerType::getUnqual(llvm::Type::getInt8Ty(context)));
	TEST_EQ(F->getReturnType(), llvm::Type::getInt8Ty(context));
	TEST(F->hasInternalLinkage());
});

END_GROUP()

BEGIN_GROUP("Symbols")

STORY("declared functions record depth, access link and parameter modes", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	FunctionDecl* f = ast.function(prog, "f");
	ast.parameter(f, "a", Type::Int());
	ast.parameter(f, "b", Type::Int(), PassByReference);
	ast.parameter(f, "c", Type::Array(TypeByte, 0));

	Codegen codegen(context);
	TEST(codegen.compile_program(prog));

	const FunctionSymbol* root = codegen.symbols().find("main");
	TEST_NEQ(root, (const FunctionSymbol*)NULL);
	TEST(!root->requires_access_link);
	TEST_EQ(root->depth, 0);

	const FunctionSymbol* symbol = codegen.symbols().find("main.f");
	TEST_NEQ(symbol, (const FunctionSymbol*)NULL);
	TEST(symbol->requires_access_link);
	TEST_EQ(symbol->depth, 1);
	TEST_EQ(symbol->param_modes.size(), 3u);
	TEST_EQ(symbol->param_modes[0], PassByValue);
	TEST_EQ(symbol->param_modes[1], PassByReference);
	TEST_EQ(symbol->param_modes[2], PassByReference);
});

STORY("runtime primitives are registered without an access link", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("main");
	Codegen codegen(context);
	TEST(codegen.compile_program(prog));

	const char* names[] = { "writeInteger", "writeByte", "writeChar", "writeString", "readInteger", "readByte",
		"readChar", "readString", "extend", "shrink", "strlen", "strcmp", "strcpy", "strcat" };
	for (size_t i = 0; i < sizeof(names)/sizeof(names[0]); ++i) {
		const FunctionSymbol* symbol = codegen.symbols().find(names[i]);
		TEST_NEQ(symbol, (const FunctionSymbol*)NULL);
		TEST(!symbol->requires_access_link);
	}
	TEST(codegen.get_module()->getFunction("writeInteger")->isDeclaration());
	TEST(!codegen.get_module()->getFunction("extend")->isDeclaration());
	TEST_EQ(codegen.symbols().find("writeString")->param_modes[0], PassByReference);
});

STORY("a name can only be declared once", {
	SymbolTable table;
	FunctionSymbol symbol;
	symbol.full_name = "main.f";
	TEST(table.declare(symbol));
	TEST(!table.declare(symbol));
	TEST_EQ(table.size(), 1u);
	TEST_EQ(table.find("main.g"), (const FunctionSymbol*)NULL);
});

STORY("a function named like a runtime primitive is rejected", {
	llvm::LLVMContext context;
	AST ast;
	FunctionDecl* prog = ast.program("strlen");
	Codegen codegen(context);
	TEST(!codegen.compile_program(prog));
	TEST(starts_with(codegen.get_error_string(), "MISSING CONTEXT"));
});

END_GROUP()

END_TESTS()
