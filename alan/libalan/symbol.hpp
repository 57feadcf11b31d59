#pragma once
#ifndef SYMBOL_HPP_WZ61LD8B
#define SYMBOL_HPP_WZ61LD8B

#include "basic.hpp"
#include "alan/ast.hpp"

#include <google/dense_hash_map>
#include <string>
#include <vector>

namespace llvm {
	class Function;
}

namespace alan {
	/*
		Everything the call lowering needs to know about a callable, recorded once
		when the callable is declared.
	*/
	struct FunctionSymbol {
		std::string full_name;
		llvm::Function* function;
		int depth;
		bool requires_access_link; // callers pass the frame of the static parent as a hidden first argument
		std::vector<PassMode> param_modes; // declared parameters only, the access link is not listed

		FunctionSymbol() : function(NULL), depth(0), requires_access_link(false) {}
	};

	class SymbolTable {
	public:
		SymbolTable();
		~SymbolTable();

		// Returns false if a callable with the same name was already declared.
		bool declare(const FunctionSymbol& symbol);
		const FunctionSymbol* find(const char* full_name) const;
		const FunctionSymbol* find(const std::string& full_name) const;
		size_t size() const { return _map.size(); }
	private:
		SymbolTable(const SymbolTable&); // hide copy constructor
		SymbolTable& operator=(const SymbolTable&);

		typedef google::dense_hash_map<std::string, FunctionSymbol*> Map;
		Map _map;
	};
}

#endif /* end of include guard: SYMBOL_HPP_WZ61LD8B */
