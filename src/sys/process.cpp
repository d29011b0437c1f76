module;
#include <boost/process.hpp>
#include <exception>
#include <filesystem>
#include <functional>
#include <istream>
#include <string>
#include <unordered_map>
#include <vector>

module protoDotCpp.sys.process;

#include "alias.hpp"

namespace protoDotCpp {
namespace process {
namespace bp = boost::process;

std::unordered_map<std::string, std::string> exeCache;

const std::string findExecutable(const std::string &name) {
  if (Path(name).has_parent_path()) return name;
  auto it = exeCache.find(name);
  if (it == exeCache.end()) {
    const auto found = bp::search_path(name);
    if (found.empty()) throw ProcessError(name, "not found in PATH");
    it = exeCache.emplace(name, found.string()).first;
  }
  return it->second;
}

int run(const std::string &exe, const std::vector<std::string> &args,
        const LineHandler &onLine) {
  const auto path = findExecutable(exe);
  try {
    bp::ipstream is;
    bp::child child(bp::exe = path, bp::args = args,
                    (bp::std_out & bp::std_err) > is);
    std::string line;
    while (std::getline(is, line)) onLine(line);
    child.wait();
    return child.exit_code();
  } catch (const bp::process_error &e) {
    throw ProcessError(path, e.code().message());
  }
}
}  // namespace process
}  // namespace protoDotCpp
