module;
#include <glob/glob.h>

#include <filesystem>
#include <set>
#include <string>

module protoDotCpp.fileProvider.Glob;

#include "alias.hpp"

namespace protoDotCpp {
namespace {
// "[" -> "[[]", "*" -> "[*]", "?" -> "[?]"
std::string escape(const Path& path) {
  std::string escaped;
  for (const char c : path.string()) {
    if (c == '[' || c == '*' || c == '?')
      escaped += std::string("[") + c + ']';
    else
      escaped += c;
  }
  return escaped;
}
}  // namespace

std::set<Path> Glob::list() const {
  std::set<Path> fileSet;
  if (!fs::is_directory(base)) return fileSet;
  const auto root = escape(base) + '/';
  auto collect = [&](const std::string& wildcard) {
    for (auto& file : glob::rglob(wildcard)) {
      if (fs::is_regular_file(file))
        fileSet.emplace(fs::absolute(file).lexically_normal());
    }
  };
  // "**" only descends into sub directories
  collect(root + pattern);
  if (recursive) collect(root + "**/" + pattern);
  return fileSet;
}
}  // namespace protoDotCpp
