#include "alan/ast.hpp"

#include <stdio.h>

static void inprintf(int indent, const char* fmt, ...);

namespace alan {
	const char* type_kind_name(TypeKind kind) {
		switch (kind) {
			case TypeNone:  return "<none>";
			case TypeInt:   return "int";
			case TypeByte:  return "byte";
			case TypeArray: return "array";
			case TypeProc:  return "proc";
			default:        return "<UNKNOWN>";
		}
	}

	size_t FunctionDecl::num_local_variables() const {
		size_t n = 0;
		for (Locals::const_iterator it = locals.begin(); it != locals.end(); ++it) {
			if (it->kind == LocalDecl::Variable) ++n;
		}
		return n;
	}

	bool FunctionDecl::set_frame_type(llvm::StructType* type) {
		if (_frame_type != NULL || type == NULL) return false;
		_frame_type = type;
		return true;
	}

	AST::AST() : _root(NULL) {}

	AST::~AST() {
		for (size_t i = 0; i < _nodes.size(); ++i) {
			delete _nodes[i];
		}
		for (size_t i = 0; i < _functions.size(); ++i) {
			delete _functions[i];
		}
	}

	const char* AST::intern(const char* str) {
		_strings.push_back(std::string(str));
		return _strings.back().c_str();
	}

	ASTNode* AST::create(ASTNodeType type) {
		ASTNode* n = new ASTNode;
		memset(n, 0, sizeof(ASTNode));
		n->type = type;
		n->next = NULL;
		n->value_type = Type::None();
		_nodes.push_back(n);
		return n;
	}

	FunctionDecl* AST::program(const char* name, Type return_type) {
		ASSERT(_root == NULL);
		FunctionDecl* f = new FunctionDecl;
		_functions.push_back(f);
		f->name = intern(name);
		f->full_name = f->name;
		f->return_type = return_type;
		f->parent = NULL;
		f->depth = 0;
		f->body = sequence();
		_root = f;
		return f;
	}

	FunctionDecl* AST::function(FunctionDecl* parent, const char* name, Type return_type) {
		ASSERT(parent != NULL);
		FunctionDecl* f = new FunctionDecl;
		_functions.push_back(f);
		f->name = intern(name);
		f->full_name = intern((std::string(parent->full_name) + "." + name).c_str());
		f->return_type = return_type;
		f->parent = parent;
		f->depth = parent->depth + 1;
		f->body = sequence();

		LocalDecl local;
		local.kind = LocalDecl::Function;
		local.name = f->name;
		local.type = Type::None();
		local.function = f;
		parent->locals.push_back(local);
		return f;
	}

	void AST::parameter(FunctionDecl* f, const char* name, Type type, PassMode pass) {
		Parameter p;
		p.name = intern(name);
		p.type = type;
		p.pass = pass;
		f->params.push_back(p);
	}

	void AST::variable(FunctionDecl* f, const char* name, Type type) {
		LocalDecl local;
		local.kind = LocalDecl::Variable;
		local.name = intern(name);
		local.type = type;
		local.function = NULL;
		f->locals.push_back(local);
	}

	ASTNode* AST::sequence(unsigned int n, ...) {
		ASTNode* seq = create(ASTNodeTypeSequence);
		seq->sequence.length = 0;
		seq->sequence.head = seq->sequence.tail = NULL;

		va_list ap;
		va_start(ap, n);
		for (unsigned int i = 0; i < n; ++i) {
			sequence_push(seq, va_arg(ap, ASTNode*));
		}
		va_end(ap);

		return seq;
	}

	void AST::sequence_push(ASTNode* seq, ASTNode* n) {
		ASSERT(seq->type == ASTNodeTypeSequence);
		ASSERT(n->next == NULL);
		++seq->sequence.length;
		if (!seq->sequence.head) { seq->sequence.head = seq->sequence.tail = n; }
		else { seq->sequence.tail->next = n; seq->sequence.tail = n; }
	}

	ASTNode* AST::assign(ASTNode* target, ASTNode* value) {
		ASTNode* n = create(ASTNodeTypeAssign);
		n->assign.target = target;
		n->assign.value = value;
		return n;
	}

	ASTNode* AST::if_else(ASTNode* cond, ASTNode* body, ASTNode* else_body) {
		ASTNode* n = create(ASTNodeTypeIfElse);
		n->if_else.cond = cond;
		n->if_else.body = body;
		n->if_else.else_body = else_body;
		return n;
	}

	ASTNode* AST::loop(ASTNode* cond, ASTNode* body) {
		ASTNode* n = create(ASTNodeTypeLoop);
		n->loop.cond = cond;
		n->loop.body = body;
		return n;
	}

	ASTNode* AST::return_(ASTNode* value) {
		ASTNode* n = create(ASTNodeTypeReturn);
		n->return_expr.value = value;
		return n;
	}

	ASTNode* AST::int_literal(int64_t value) {
		ASTNode* n = create(ASTNodeTypeIntLiteral);
		n->int_literal.value = value;
		n->value_type = Type::Int();
		return n;
	}

	ASTNode* AST::char_literal(byte value) {
		ASTNode* n = create(ASTNodeTypeCharLiteral);
		n->char_literal.value = value;
		n->value_type = Type::Byte();
		return n;
	}

	ASTNode* AST::value(ASTNode* lvalue) {
		ASTNode* n = create(ASTNodeTypeValue);
		n->value.lvalue = lvalue;
		// reading a[i] yields an element, reading a yields the whole array
		if (lvalue->value_type.is_array() && lvalue->type == ASTNodeTypeIdentifier && lvalue->identifier.subscript) {
			n->value_type = lvalue->value_type.element_type();
		} else {
			n->value_type = lvalue->value_type;
		}
		return n;
	}

	ASTNode* AST::call(const char* callee, int caller_depth, int callee_depth, ASTNode* args, Type return_type) {
		ASTNode* n = create(ASTNodeTypeCall);
		n->call.callee = intern(callee);
		n->call.caller_depth = caller_depth;
		n->call.callee_depth = callee_depth;
		n->call.args = args ? args : sequence();
		n->value_type = return_type;
		return n;
	}

	ASTNode* AST::sign(Sign sign, ASTNode* expr) {
		ASTNode* n = create(ASTNodeTypeSign);
		n->sign.sign = sign;
		n->sign.expr = expr;
		n->value_type = expr->value_type;
		return n;
	}

	ASTNode* AST::binary(ASTNode* left, BinaryOperator op, ASTNode* right) {
		ASTNode* n = create(ASTNodeTypeBinary);
		n->binary.left = left;
		n->binary.op = op;
		n->binary.right = right;
		n->value_type = left->value_type;
		return n;
	}

	ASTNode* AST::identifier(const char* name, Type type, int nesting_diff, int offset, bool is_parameter, bool is_reference, ASTNode* subscript) {
		ASTNode* n = create(ASTNodeTypeIdentifier);
		n->identifier.name = intern(name);
		n->identifier.subscript = subscript;
		n->identifier.nesting_diff = nesting_diff;
		n->identifier.offset = offset;
		n->identifier.is_parameter = is_parameter;
		n->identifier.is_reference = is_reference;
		n->value_type = type;
		return n;
	}

	ASTNode* AST::string_literal(const char* data) {
		ASTNode* n = create(ASTNodeTypeStringLiteral);
		n->string_literal.data = intern(data);
		n->value_type = Type::Array(TypeByte, strlen(data) + 1);
		return n;
	}

	ASTNode* AST::logic_not(ASTNode* cond) {
		ASTNode* n = create(ASTNodeTypeNot);
		n->logic_not.cond = cond;
		return n;
	}

	ASTNode* AST::compare(ASTNode* left, CompareOperator op, ASTNode* right) {
		ASTNode* n = create(ASTNodeTypeCompare);
		n->compare.left = left;
		n->compare.op = op;
		n->compare.right = right;
		return n;
	}

	ASTNode* AST::logic_and(ASTNode* left, ASTNode* right) {
		ASTNode* n = create(ASTNodeTypeAnd);
		n->logic_and.left = left;
		n->logic_and.right = right;
		return n;
	}

	ASTNode* AST::logic_or(ASTNode* left, ASTNode* right) {
		ASTNode* n = logic_and(left, right); n->type = ASTNodeTypeOr;
		return n;
	}

	void AST::print(const FunctionDecl* f, int indent) const {
		if (!f) f = _root;
		if (!f) { inprintf(indent, "<NULL>\n"); return; }

		inprintf(indent, "FUNCTION %s (depth %d) : %s\n", f->full_name, f->depth, type_kind_name(f->return_type.kind));
		for (size_t i = 0; i < f->params.size(); ++i) {
			const Parameter& p = f->params[i];
			inprintf(indent+1, "PARAM %s : %s%s\n", p.name, type_kind_name(p.type.kind), p.pass == PassByReference ? " (reference)" : "");
		}
		for (FunctionDecl::Locals::const_iterator it = f->locals.begin(); it != f->locals.end(); ++it) {
			if (it->kind == LocalDecl::Variable) {
				inprintf(indent+1, "VAR %s : %s\n", it->name, type_kind_name(it->type.kind));
			} else {
				print(it->function, indent+1);
			}
		}
		inprintf(indent+1, "BODY:\n");
		print_r(f->body, indent+2);
	}

	void AST::print_r(const ASTNode* n, int indent) const {
		if (!n) { inprintf(indent, "<NULL>\n"); return; }

		switch (n->type) {
			case ASTNodeTypeSequence: {
				inprintf(indent, "SEQUENCE: ");
				const ASTNode* x = n->sequence.head;
				if (x) printf("\n");
				else printf("<EMPTY>\n");
				while (x) {
					print_r(x, indent+1);
					x = x->next;
				}
				break;
			}
			case ASTNodeTypeIntLiteral: { inprintf(indent, "INT: %" PRId64 "\n", n->int_literal.value); break; }
			case ASTNodeTypeCharLiteral: { inprintf(indent, "CHAR: %u\n", (unsigned)n->char_literal.value); break; }
			case ASTNodeTypeValue: {
				inprintf(indent, "VALUE:\n");
				print_r(n->value.lvalue, indent+1);
				break;
			}
			case ASTNodeTypeCall: {
				inprintf(indent, "CALL %s (caller depth %d, callee depth %d):", n->call.callee, n->call.caller_depth, n->call.callee_depth);
				if (n->call.args->sequence.head) {
					printf("\n");
					int i = 0;
					for (const ASTNode* x = n->call.args->sequence.head; x; x = x->next) {
						inprintf(indent+1, "ARG %d:\n", i++);
						print_r(x, indent+2);
					}
				} else {
					printf(" <NO ARGUMENTS>\n");
				}
				break;
			}
			case ASTNodeTypeSign: {
				inprintf(indent, "SIGN %c:\n", n->sign.sign == SignPlus ? '+' : '-');
				print_r(n->sign.expr, indent+1);
				break;
			}
			case ASTNodeTypeBinary: {
				static const char ops[] = { '+', '-', '*', '/', '%' };
				inprintf(indent, "BINARY %c : %s\n", ops[n->binary.op], type_kind_name(n->value_type.kind));
				print_r(n->binary.left, indent+1);
				print_r(n->binary.right, indent+1);
				break;
			}
			case ASTNodeTypeIdentifier: {
				inprintf(indent, "IDENTIFIER: %s (diff %d, offset %d, %s%s)\n", n->identifier.name, n->identifier.nesting_diff, n->identifier.offset,
					n->identifier.is_parameter ? "parameter" : "local", n->identifier.is_reference ? ", reference" : "");
				if (n->identifier.subscript) {
					inprintf(indent+1, "SUBSCRIPT:\n");
					print_r(n->identifier.subscript, indent+2);
				}
				break;
			}
			case ASTNodeTypeStringLiteral: { inprintf(indent, "STRING: \"%s\"\n", n->string_literal.data); break; }
			case ASTNodeTypeTrue: { inprintf(indent, "TRUE\n"); break; }
			case ASTNodeTypeFalse: { inprintf(indent, "FALSE\n"); break; }
			case ASTNodeTypeNot: {
				inprintf(indent, "NOT:\n");
				print_r(n->logic_not.cond, indent+1);
				break;
			}
			case ASTNodeTypeCompare: {
				static const char* ops[] = { "==", "!=", "<", ">", "<=", ">=" };
				inprintf(indent, "COMPARE %s:\n", ops[n->compare.op]);
				print_r(n->compare.left, indent+1);
				print_r(n->compare.right, indent+1);
				break;
			}
			case ASTNodeTypeAnd:
			case ASTNodeTypeOr: {
				inprintf(indent, "LOGIC %s:\n", n->type == ASTNodeTypeAnd ? "AND" : "OR");
				inprintf(indent+1, "LEFT:\n");
				print_r(n->logic_and.left, indent+2);
				inprintf(indent+1, "RIGHT:\n");
				print_r(n->logic_and.right, indent+2);
				break;
			}
			case ASTNodeTypeEmpty: { inprintf(indent, "EMPTY\n"); break; }
			case ASTNodeTypeAssign: {
				inprintf(indent, "ASSIGN:\n");
				inprintf(indent+1, "TARGET:\n");
				print_r(n->assign.target, indent+2);
				inprintf(indent+1, "VALUE:\n");
				print_r(n->assign.value, indent+2);
				break;
			}
			case ASTNodeTypeIfElse: {
				inprintf(indent, "IF:\n");
				inprintf(indent+1, "CONDITION:\n");
				print_r(n->if_else.cond, indent+2);
				inprintf(indent+1, "BODY:\n");
				print_r(n->if_else.body, indent+2);
				if (n->if_else.else_body) {
					inprintf(indent+1, "ELSE:\n");
					print_r(n->if_else.else_body, indent+2);
				}
				break;
			}
			case ASTNodeTypeLoop: {
				inprintf(indent, "LOOP:\n");
				inprintf(indent+1, "CONDITION:\n");
				print_r(n->loop.cond, indent+2);
				inprintf(indent+1, "BODY:\n");
				print_r(n->loop.body, indent+2);
				break;
			}
			case ASTNodeTypeReturn: {
				inprintf(indent, "RETURN");
				if (n->return_expr.value == NULL) printf("\n");
				else {
					printf(":\n");
					print_r(n->return_expr.value, indent+1);
				}
				break;
			}
		}
	}
}

static void inprintf(int indent, const char* fmt, ...) {
	for (int i = 0; i < indent; ++i) printf(" ");
	va_list ap;
	va_start(ap, fmt);
	vprintf(fmt, ap);
	va_end(ap);
}
