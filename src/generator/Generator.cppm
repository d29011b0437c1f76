module;
#include <exception>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

export module protoDotCpp.generator.Generator;
import protoDotCpp.compiler;
import protoDotCpp.project.Settings;
import protoDotCpp.unpack.DependencyUnpacker;

#include "alias.hpp"

namespace protoDotCpp {
export class CompileError : public std::exception {
 private:
  int exitCode;
  std::string msg;

 public:
  CompileError(int exitCode)
      : exitCode(exitCode),
        msg("protoc returned exit code: " + std::to_string(exitCode)) {}

  int getExitCode() const { return exitCode; }

  const char *what() const noexcept override { return msg.c_str(); }
};

export struct GenerateError {
  enum Kind { LaunchFailure, CompileFailure, ExtractionFailure } kind;
  std::string message;
  int exitCode = 0;
};

export class GenerateResult {
 private:
  std::variant<std::vector<Path>, GenerateError> value;

 public:
  GenerateResult(std::vector<Path> files) : value(std::move(files)) {}
  GenerateResult(GenerateError error) : value(std::move(error)) {}

  bool ok() const { return std::holds_alternative<std::vector<Path>>(value); }

  const std::vector<Path> &getFiles() const {
    return std::get<std::vector<Path>>(value);
  }

  const GenerateError &getError() const {
    return std::get<GenerateError>(value);
  }
};

// Turns the schema files into generated sources, running the compiler only
// when the schemas or the generated files changed since the last run.
export class Generator {
 private:
  const Settings settings;
  const std::shared_ptr<const Compiler> compiler;

 public:
  Generator(const Settings &settings,
            const std::shared_ptr<const Compiler> &compiler)
      : settings(settings), compiler(compiler) {}

  UnpackedDependencies unpackDependencies() const;

  std::set<Path> discoverSchemas() const;

  // Runs the compiler over schemas and returns the files of every target.
  // Throws LaunchError or CompileError.
  std::set<Path> compile(const std::set<Path> &schemas) const;

  GenerateResult generate() const;

  void clean() const;
};
}  // namespace protoDotCpp
