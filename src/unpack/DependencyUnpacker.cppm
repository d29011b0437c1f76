module;
#include <exception>
#include <filesystem>
#include <string>
#include <vector>

export module protoDotCpp.unpack.DependencyUnpacker;

#include "alias.hpp"
#include "macro.hpp"

namespace protoDotCpp {
export DEF_EXCEPTION(ExtractionError,
                     (const Path &archive, const std::string &reason),
                     "failed to extract " + archive.generic_string() + ": " +
                         reason);

export struct UnpackedDependencies {
  Path dir;
  std::vector<Path> files;
};

// Extracts the entries of every archive whose file name ends with extension
// into target, keeping their relative paths. Existing files are overwritten,
// nothing is removed.
export UnpackedDependencies unpackDependencies(
    const std::vector<Path> &archives, const Path &target,
    const std::string &extension);

export std::vector<Path> unpack(const Path &archive, const Path &target,
                                const std::string &extension);
}  // namespace protoDotCpp
