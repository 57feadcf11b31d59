#pragma once
#ifndef AST_HPP_7HCN2XWE
#define AST_HPP_7HCN2XWE

#include "alan/basic.h"
#include "alan/type.hpp"

#include <list>
#include <string>
#include <vector>

namespace llvm {
	class StructType;
}

namespace alan {
	/*
		The tree handed to the code generator has already been through semantic
		analysis: every identifier knows how many scopes up it was declared and
		which frame field it lives in, every call site knows the nesting depths
		of its caller and callee, and every expression carries its static type.
	*/

	enum ASTNodeType {
		ASTNodeTypeSequence,

		// expressions
		ASTNodeTypeIntLiteral,
		ASTNodeTypeCharLiteral,
		ASTNodeTypeValue,
		ASTNodeTypeCall,
		ASTNodeTypeSign,
		ASTNodeTypeBinary,

		// lvalues
		ASTNodeTypeIdentifier,
		ASTNodeTypeStringLiteral,

		// conditions
		ASTNodeTypeTrue,
		ASTNodeTypeFalse,
		ASTNodeTypeNot,
		ASTNodeTypeCompare,
		ASTNodeTypeAnd,
		ASTNodeTypeOr,

		// statements (calls and sequences double as statements)
		ASTNodeTypeEmpty,
		ASTNodeTypeAssign,
		ASTNodeTypeIfElse,
		ASTNodeTypeLoop,
		ASTNodeTypeReturn
	};

	enum Sign { SignPlus, SignMinus };
	enum BinaryOperator { OpAdd, OpSub, OpMul, OpDiv, OpMod };
	enum CompareOperator { CmpEq, CmpNe, CmpLt, CmpGt, CmpLe, CmpGe };
	enum PassMode { PassByValue, PassByReference };

	struct ASTNode {
		ASTNodeType type;
		ASTNode* next; // implicit linked list for sequences -- NULL otherwise
		Type value_type; // static type of expressions and lvalues, TypeNone elsewhere
		union {
			struct { ASTNode *head, *tail; size_t length; } sequence;
			struct { int64_t value; }                     int_literal;
			struct { byte value; }                        char_literal;
			struct { ASTNode* lvalue; }                   value;
			struct { const char* callee; int caller_depth; int callee_depth; ASTNode* args; } call;
			struct { Sign sign; ASTNode* expr; }          sign;
			struct { ASTNode* left; BinaryOperator op; ASTNode* right; } binary;
			struct {
				const char* name;
				ASTNode* subscript;  // only for arrays
				int nesting_diff;    // access links to follow from the current frame
				int offset;          // field index in the target frame; field 0 is the access link
				bool is_parameter;
				bool is_reference;
			} identifier;
			struct { const char* data; }                  string_literal;
			struct { ASTNode* cond; }                     logic_not;
			struct { ASTNode* left; CompareOperator op; ASTNode* right; } compare;
			struct { ASTNode *left, *right; }             logic_and, logic_or;
			struct { ASTNode *target, *value; }           assign;
			struct { ASTNode *cond, *body, *else_body; }  if_else;
			struct { ASTNode *cond, *body; }              loop;
			struct { ASTNode* value; }                    return_expr;
		};
	};

	struct Parameter {
		const char* name;
		Type type;
		PassMode pass;
	};

	struct FunctionDecl;

	struct LocalDecl {
		enum Kind { Variable, Function };
		Kind kind;
		const char* name;
		Type type;              // Variable only
		FunctionDecl* function; // Function only
	};

	struct FunctionDecl {
		typedef std::vector<Parameter> Parameters;
		typedef std::vector<LocalDecl> Locals;

		const char* name;
		const char* full_name; // globally unique
		Parameters params;
		Locals locals;
		ASTNode* body; // sequence of statements
		Type return_type;
		FunctionDecl* parent; // the outermost function is its own parent once code generation starts
		int depth;            // 0 for the outermost function

		FunctionDecl() : name(NULL), full_name(NULL), body(NULL), return_type(Type::Proc()), parent(NULL), depth(0), _frame_type(NULL) {}

		bool is_outermost() const { return parent == NULL || parent == this; }
		size_t num_local_variables() const;

		// The frame type is computed once by the code generator and never changes.
		bool has_frame_type() const { return _frame_type != NULL; }
		llvm::StructType* frame_type() const { return _frame_type; }
		bool set_frame_type(llvm::StructType* type);
	private:
		llvm::StructType* _frame_type;
	};

	class AST {
	public:
		AST();
		~AST();

		FunctionDecl* root() const { return _root; }
		void print(const FunctionDecl* f = NULL, int indent = 0) const; // NULL means start from root

		// declarations
		FunctionDecl* program(const char* name, Type return_type = Type::Proc());
		FunctionDecl* function(FunctionDecl* parent, const char* name, Type return_type = Type::Proc());
		void parameter(FunctionDecl* f, const char* name, Type type, PassMode pass = PassByValue);
		void variable(FunctionDecl* f, const char* name, Type type);

		// statements
		ASTNode* sequence(unsigned int n = 0, ...);
		void sequence_push(ASTNode* seq, ASTNode* n);
		ASTNode* empty() { return create(ASTNodeTypeEmpty); }
		ASTNode* assign(ASTNode* target, ASTNode* value);
		ASTNode* if_else(ASTNode* cond, ASTNode* body, ASTNode* else_body = NULL);
		ASTNode* loop(ASTNode* cond, ASTNode* body);
		ASTNode* return_(ASTNode* value = NULL);

		// expressions
		ASTNode* int_literal(int64_t value);
		ASTNode* char_literal(byte value);
		ASTNode* value(ASTNode* lvalue);
		ASTNode* call(const char* callee, int caller_depth, int callee_depth, ASTNode* args, Type return_type = Type::Proc());
		ASTNode* sign(Sign sign, ASTNode* expr);
		ASTNode* binary(ASTNode* left, BinaryOperator op, ASTNode* right);

		// lvalues
		ASTNode* identifier(const char* name, Type type, int nesting_diff, int offset, bool is_parameter, bool is_reference = false, ASTNode* subscript = NULL);
		ASTNode* string_literal(const char* data);

		// conditions
		ASTNode* true_() { return create(ASTNodeTypeTrue); }
		ASTNode* false_() { return create(ASTNodeTypeFalse); }
		ASTNode* logic_not(ASTNode* cond);
		ASTNode* compare(ASTNode* left, CompareOperator op, ASTNode* right);
		ASTNode* logic_and(ASTNode* left, ASTNode* right);
		ASTNode* logic_or(ASTNode* left, ASTNode* right);
	private:
		AST(const AST&); // hide copy constructor
		AST& operator=(const AST&);

		FunctionDecl* _root;
		std::vector<ASTNode*> _nodes;
		std::vector<FunctionDecl*> _functions;
		std::list<std::string> _strings;

		ASTNode* create(ASTNodeType type);
		const char* intern(const char* str);
		void print_r(const ASTNode* n, int indent) const;
	};
}

#endif /* end of include guard: AST_HPP_7HCN2XWE */
