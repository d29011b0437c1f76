module;
#include <filesystem>
#include <set>
#include <string>

export module protoDotCpp.fileProvider.Glob;
import protoDotCpp.fileProvider;

#include "alias.hpp"
#include "macro.hpp"

namespace protoDotCpp {
// Files under base whose name matches pattern, searched recursively unless
// told otherwise. Glob characters in base are taken literally.
export class Glob : public FileProvider {
  const Path base;
  const std::string pattern;

  CHAIN_VAR(bool, recursive, true, setRecursive);

 public:
  Glob(const Path& base, const std::string& pattern)
      : base(fs::absolute(base)), pattern(pattern) {}

  std::set<Path> list() const override;
};
}  // namespace protoDotCpp
