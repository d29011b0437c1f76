module;
#include <exception>
#include <functional>
#include <string>
#include <vector>

export module protoDotCpp.sys.process;

#include "macro.hpp"

namespace protoDotCpp {
namespace process {
export DEF_EXCEPTION(ProcessError,
                     (const std::string &exe, const std::string &reason),
                     "cannot run " + exe + ": " + reason);

export using LineHandler = std::function<void(const std::string &line)>;

// Resolves a bare name against PATH. Names with a directory part are
// returned unchanged.
export const std::string findExecutable(const std::string &name);

// Runs exe with args, passing every line of its merged stdout and stderr to
// onLine, and blocks until it exits.
export int run(const std::string &exe, const std::vector<std::string> &args,
               const LineHandler &onLine);
}  // namespace process
}  // namespace protoDotCpp
