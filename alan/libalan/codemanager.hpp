#pragma once
#ifndef CODEMANAGER_HPP_P0G5YJ3E
#define CODEMANAGER_HPP_P0G5YJ3E

#include "alan/ast.hpp"

namespace llvm {
	class Module;
}

namespace alan {
	struct CompileOptions;

	class CodeManager {
	public:
		enum OptimizationLevel {
			OPTIMIZATION_NONE,
			OPTIMIZATION_NORMAL,
			OPTIMIZATION_AGGRESSIVE,
		};

		CodeManager();
		~CodeManager();

		bool compile(FunctionDecl* program, const CompileOptions& options);
		bool write_ir(const char* path);
		bool write_bitcode(const char* path);

		/*
			JIT-compiles the module and calls the outermost function. The module
			cannot be written out afterwards. out_result receives the return
			value of value-returning programs.
		*/
		bool run_main(int64_t* out_result = NULL);
		static void register_runtime_symbol(const char* name, void* address);

		void set_default_optimization_level(OptimizationLevel level);
		llvm::Module* get_module() const;
		const char* get_error_string() const;

		static void init();
	private:
		CodeManager(const CodeManager&); // hide copy constructor
		CodeManager& operator=(const CodeManager&);

		class Impl;
		Impl* _impl;
	};
}

#endif /* end of include guard: CODEMANAGER_HPP_P0G5YJ3E */
