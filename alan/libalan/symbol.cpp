#include "symbol.hpp"

namespace alan {
	SymbolTable::SymbolTable() {
		_map.set_empty_key(std::string());
		_map.set_deleted_key(std::string("<DELETED SYMBOL>"));
	}

	SymbolTable::~SymbolTable() {
		for (Map::iterator it = _map.begin(); it != _map.end(); ++it) {
			delete it->second;
		}
	}

	bool SymbolTable::declare(const FunctionSymbol& symbol) {
		if (symbol.full_name.empty()) return false;
		Map::const_iterator it = _map.find(symbol.full_name);
		if (it != _map.end()) return false;
		_map[symbol.full_name] = new FunctionSymbol(symbol);
		return true;
	}

	const FunctionSymbol* SymbolTable::find(const std::string& full_name) const {
		Map::const_iterator it = _map.find(full_name);
		if (it != _map.end()) return it->second;
		return NULL;
	}

	const FunctionSymbol* SymbolTable::find(const char* full_name) const {
		return find(std::string(full_name));
	}
}
