module;
#include <exception>
#include <filesystem>
#include <set>
#include <string>
#include <vector>

module protoDotCpp.compiler;

#include "alias.hpp"

namespace protoDotCpp {
std::vector<std::string> Compiler::buildArgs(
    const std::vector<Path> &includePaths,
    const std::vector<std::string> &options, const std::set<Path> &schemas) {
  std::vector<std::string> args;
  args.reserve(includePaths.size() + options.size() + schemas.size());
  for (const auto &includePath : includePaths)
    args.emplace_back("-I" + fs::absolute(includePath).string());
  args.insert(args.end(), options.begin(), options.end());
  for (const auto &schema : schemas)
    args.emplace_back(fs::absolute(schema).string());
  return args;
}

int Compiler::compile(const std::vector<Path> &includePaths,
                      const std::vector<std::string> &options,
                      const std::set<Path> &schemas) const {
  const auto args = buildArgs(includePaths, options, schemas);
  try {
    return execute(args);
  } catch (const LaunchError &) {
    throw;
  } catch (const std::exception &e) {
    throw LaunchError(e.what());
  }
}
}  // namespace protoDotCpp
