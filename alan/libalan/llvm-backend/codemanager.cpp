#include "basic.hpp"
#include "codemanager.hpp"
#include "llvm-backend/codegen.hpp"

#include <llvm/IR/LLVMContext.h>
#include <llvm/IR/Module.h>
#include <llvm/ExecutionEngine/ExecutionEngine.h>
#include <llvm/ExecutionEngine/MCJIT.h>
#include <llvm/Bitcode/BitcodeWriter.h>
#include <llvm/Support/CodeGen.h>
#include <llvm/Support/DynamicLibrary.h>
#include <llvm/Support/FileSystem.h>
#include <llvm/Support/TargetSelect.h>
#include <llvm/Support/raw_ostream.h>

#include <string>
#include <system_error>

namespace alan {
	class CodeManager::Impl {
	public:
		Impl() : _default_optimization_level(OPTIMIZATION_NORMAL), _jit_module(NULL), _engine(NULL), _main_return_type(Type::Proc()) {}
		~Impl();
		void set_default_optimization_level(OptimizationLevel level) { _default_optimization_level = level; }
		bool compile(FunctionDecl* program, const CompileOptions& options);
		bool write_ir(const char* path);
		bool write_bitcode(const char* path);
		bool run_main(int64_t* out_result);
		llvm::Module* get_module() const { return _module ? _module.get() : _jit_module; }
		const char* get_error_string() const { return _error.empty() ? NULL : _error.c_str(); }
	private:
		bool error(const std::string& message);
		bool create_engine();
		llvm::CodeGenOpt::Level get_codegen_level() const;

		OptimizationLevel _default_optimization_level;
		llvm::LLVMContext _context;
		std::unique_ptr<llvm::Module> _module; // until the engine takes it
		llvm::Module* _jit_module;
		llvm::ExecutionEngine* _engine;
		std::string _main_name;
		Type _main_return_type;
		std::string _error;
	};

	CodeManager::Impl::~Impl() {
		delete _engine; // owns _jit_module
	}

	bool CodeManager::Impl::error(const std::string& message) {
		_error = message;
		fprintf(stderr, "ERROR: %s\n", message.c_str());
		return false;
	}

	bool CodeManager::Impl::compile(FunctionDecl* program, const CompileOptions& options) {
		if (_module || _engine) return error("A program has already been compiled.");

		Codegen codegen(_context, options);
		if (!codegen.compile_program(program)) {
			const char* reason = codegen.get_error_string();
			return error(std::string("Compilation failed: ") + (reason ? reason : "unknown error"));
		}

		_module = codegen.release_module();
		_main_name = program->full_name;
		_main_return_type = program->return_type;
		if (!program->params.empty()) {
			// still a valid module, but there is nothing to pass it when run
			fprintf(stderr, "WARNING: Outermost function '%s' takes parameters and cannot be run.\n", _main_name.c_str());
		}
		return true;
	}

	bool CodeManager::Impl::write_ir(const char* path) {
		if (!_module) return error("No module to write.");
		std::error_code ec;
		llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_Text);
		if (ec) return error(std::string("Could not open ") + path + ": " + ec.message());
		_module->print(out, NULL);
		return true;
	}

	bool CodeManager::Impl::write_bitcode(const char* path) {
		if (!_module) return error("No module to write.");
		std::error_code ec;
		llvm::raw_fd_ostream out(path, ec, llvm::sys::fs::OF_None);
		if (ec) return error(std::string("Could not open ") + path + ": " + ec.message());
		llvm::WriteBitcodeToFile(*_module, out);
		return true;
	}

	llvm::CodeGenOpt::Level CodeManager::Impl::get_codegen_level() const {
		switch (_default_optimization_level) {
			case OPTIMIZATION_NONE:       return llvm::CodeGenOpt::None;
			case OPTIMIZATION_AGGRESSIVE: return llvm::CodeGenOpt::Aggressive;
			default:                      return llvm::CodeGenOpt::Default;
		}
	}

	bool CodeManager::Impl::create_engine() {
		if (!_module) return error("No module to run.");

		std::string engine_error;
		_jit_module = _module.get();
		_engine = llvm::EngineBuilder(std::move(_module))
			.setErrorStr(&engine_error)
			.setEngineKind(llvm::EngineKind::JIT)
			.setOptLevel(get_codegen_level())
			.create();
		if (!_engine) {
			_jit_module = NULL;
			return error("Error creating ExecutionEngine: " + engine_error);
		}

		_engine->finalizeObject();
		if (_engine->hasError()) return error("Error finalizing JIT code: " + _engine->getErrorMessage());
		return true;
	}

	bool CodeManager::Impl::run_main(int64_t* out_result) {
		if (!_engine && !create_engine()) return false;

		uint64_t address = _engine->getFunctionAddress(_main_name);
		if (!address) return error("Main function '" + _main_name + "' not found in module!");

		int64_t result = 0;
		switch (_main_return_type.kind) {
			case TypeInt: {
				int16_t (*f)() = (int16_t (*)())address;
				result = f();
				break;
			}
			case TypeByte: {
				uint8_t (*f)() = (uint8_t (*)())address;
				result = f();
				break;
			}
			default: {
				void (*f)() = (void (*)())address;
				f();
				break;
			}
		}
		if (out_result) *out_result = result;
		return true;
	}

	void CodeManager::init() {
		llvm::InitializeNativeTarget();
		llvm::InitializeNativeTargetAsmPrinter();
		llvm::InitializeNativeTargetAsmParser();
		llvm::sys::DynamicLibrary::LoadLibraryPermanently(NULL);
	}

	CodeManager::CodeManager() : _impl(new Impl) {}

	CodeManager::~CodeManager() {
		delete _impl;
	}

	bool CodeManager::compile(FunctionDecl* program, const CompileOptions& options) {
		return _impl->compile(program, options);
	}

	bool CodeManager::write_ir(const char* path) {
		return _impl->write_ir(path);
	}

	bool CodeManager::write_bitcode(const char* path) {
		return _impl->write_bitcode(path);
	}

	bool CodeManager::run_main(int64_t* out_result) {
		return _impl->run_main(out_result);
	}

	void CodeManager::register_runtime_symbol(const char* name, void* address) {
		llvm::sys::DynamicLibrary::AddSymbol(name, address);
	}

	void CodeManager::set_default_optimization_level(OptimizationLevel level) {
		_impl->set_default_optimization_level(level);
	}

	llvm::Module* CodeManager::get_module() const {
		return _impl->get_module();
	}

	const char* CodeManager::get_error_string() const {
		return _impl->get_error_string();
	}
}
