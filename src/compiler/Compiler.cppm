module;
#include <exception>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

export module protoDotCpp.compiler;

#include "alias.hpp"
#include "macro.hpp"

namespace protoDotCpp {
export DEF_EXCEPTION(LaunchError, (const std::string &reason),
                     "error occurred while compiling protobuf files: " +
                         reason);

// The external schema compiler.
export class Compiler {
 public:
  virtual ~Compiler() = default;

  virtual std::string getName() const = 0;

  // Returns the exit code. Throws when the compiler cannot be started.
  virtual int execute(const std::vector<std::string> &args) const = 0;

  // -I<include> for every include path, then the options, then the schemas.
  static std::vector<std::string> buildArgs(
      const std::vector<Path> &includePaths,
      const std::vector<std::string> &options, const std::set<Path> &schemas);

  int compile(const std::vector<Path> &includePaths,
              const std::vector<std::string> &options,
              const std::set<Path> &schemas) const;
};
}  // namespace protoDotCpp
