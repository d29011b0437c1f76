module;
#include <filesystem>
#include <set>
#include <string>
#include <vector>

export module protoDotCpp.generator.SchemaDiscovery;
import protoDotCpp.fileProvider.Glob;

#include "alias.hpp"

namespace protoDotCpp {
// Every file ending with extension below any of the directories.
export std::set<Path> discoverSchemas(const std::vector<Path> &directories,
                                      const std::string &extension) {
  std::set<Path> schemas;
  for (const auto &dir : directories)
    schemas.merge(Glob(dir, "*" + extension).list());
  return schemas;
}
}  // namespace protoDotCpp
