module;
#include <boost/json.hpp>
#include <algorithm>
#include <array>
#include <exception>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

module protoDotCpp.project.Settings;
import protoDotCpp.utils;

#include "alias.hpp"

namespace protoDotCpp {
namespace {
// pattern suffix -> output kind
const std::array<std::pair<std::string, std::string>, 6> outputKinds{{
    {".java", "java"},
    {".py", "python"},
    {".cc", "cpp"},
    {".h", "cpp"},
    {".cs", "csharp"},
    {".rb", "ruby"},
}};

std::string outputKindOf(const std::string &pattern) {
  for (const auto &[suffix, kind] : outputKinds) {
    if (pattern.size() >= suffix.size() &&
        pattern.compare(pattern.size() - suffix.size(), suffix.size(),
                        suffix) == 0)
      return kind;
  }
  return {};
}

Path resolvePath(const Path &path, const Path &base) {
  return (path.is_absolute() ? path : base / path).lexically_normal();
}
}  // namespace

std::string GeneratedTarget::getOutputFlag() const {
  const auto kind = outputKindOf(pattern);
  if (kind.empty()) return {};
  return "--" + kind + "_out=" + fs::absolute(directory).string();
}

Settings Settings::create(const Path &configPath) {
  if (!fs::is_regular_file(configPath)) throw ConfigNotFound(configPath);
  return parse(parseJson(configPath),
               fs::absolute(configPath).parent_path());
}

Settings Settings::parse(const json::value &jv, const Path &base) {
  Settings settings = json::value_to<Merge<Settings>>(jv);
  settings.resolve(base);
  return settings;
}

void Settings::resolve(const Path &base) {
  auto resolveAll = [&](std::vector<Path> &paths) {
    for (auto &path : paths) path = resolvePath(path, base);
  };
  resolveAll(sourceDirectories);
  resolveAll(includePaths);
  resolveAll(dependencies);
  externalIncludePath = resolvePath(externalIncludePath, base);
  cacheDirectory = resolvePath(cacheDirectory, base);
  for (auto &target : generatedTargets)
    target.directory = resolvePath(target.directory, base);
}

std::vector<Path> Settings::getIncludePaths() const {
  std::vector<Path> result;
  auto append = [&](const Path &path) {
    if (std::find(result.begin(), result.end(), path) == result.end())
      result.emplace_back(path);
  };
  for (const auto &path : includePaths.empty() ? sourceDirectories
                                               : includePaths)
    append(path);
  append(externalIncludePath);
  return result;
}

std::vector<Path> Settings::getSchemaDirectories() const {
  std::vector<Path> result(sourceDirectories);
  result.emplace_back(externalIncludePath);
  return result;
}

std::vector<std::string> Settings::getCompilerOptions() const {
  std::vector<std::string> options;
  std::unordered_set<std::string> emittedKinds;
  for (const auto &target : generatedTargets) {
    const auto kind = outputKindOf(target.pattern);
    if (kind.empty() || !emittedKinds.insert(kind).second) continue;
    options.emplace_back(target.getOutputFlag());
  }
  options.insert(options.end(), protocOptions.begin(), protocOptions.end());
  return options;
}

std::vector<Path> Settings::getTargetDirectories() const {
  std::vector<Path> dirs;
  dirs.reserve(generatedTargets.size());
  for (const auto &target : generatedTargets)
    dirs.emplace_back(target.directory);
  return dirs;
}
}  // namespace protoDotCpp
