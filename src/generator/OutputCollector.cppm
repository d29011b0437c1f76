module;
#include <filesystem>
#include <set>
#include <vector>

export module protoDotCpp.generator.OutputCollector;
import protoDotCpp.fileProvider.Glob;
import protoDotCpp.project.Settings;

#include "alias.hpp"

namespace protoDotCpp {
// Everything currently matching the targets, whoever wrote it.
export std::set<Path> collectOutputs(
    const std::vector<GeneratedTarget> &targets) {
  std::set<Path> outputs;
  for (const auto &target : targets)
    outputs.merge(Glob(target.directory, target.pattern).list());
  return outputs;
}
}  // namespace protoDotCpp
