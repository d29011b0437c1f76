module;
#include <filesystem>
#include <set>

export module protoDotCpp.fileProvider;

#include "alias.hpp"

namespace protoDotCpp {
export class FileProvider {
 public:
  virtual ~FileProvider() = default;

  virtual std::set<Path> list() const = 0;
};
}  // namespace protoDotCpp
