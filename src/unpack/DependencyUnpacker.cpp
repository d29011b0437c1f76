module;
#include <exception>
#include <filesystem>
#include <fstream>
#include <ios>
#include <string>
#include <vector>

module protoDotCpp.unpack.DependencyUnpacker;
import protoDotCpp.sys.logger;
import protoDotCpp.unpack.ZipArchive;

#include "alias.hpp"

namespace protoDotCpp {
namespace {
bool escapesTarget(const Path &relative) {
  if (relative.empty() || relative.is_absolute() || relative.has_root_name())
    return true;
  const auto first = *relative.begin();
  return first == "..";
}
}  // namespace

std::vector<Path> unpack(const Path &archive, const Path &target,
                         const std::string &extension) {
  std::vector<Path> extracted;
  try {
    const ZipArchive zip(archive);
    for (const auto &entry : zip.getEntries()) {
      if (entry.isDirectory()) continue;
      const Path relative = Path(entry.name).lexically_normal();
      if (relative.extension() != extension) continue;
      if (escapesTarget(relative))
        throw ExtractionError(archive, "illegal entry " + entry.name);
      const auto content = zip.read(entry);
      const Path output = target / relative;
      fs::create_directories(output.parent_path());
      std::ofstream os(output, std::ios::binary | std::ios::trunc);
      os.exceptions(std::ofstream::failbit | std::ofstream::badbit);
      os.write(content.data(), static_cast<std::streamsize>(content.size()));
      extracted.emplace_back(output);
    }
  } catch (const ZipArchive::ArchiveError &e) {
    throw ExtractionError(archive, e.what());
  } catch (const fs::filesystem_error &e) {
    throw ExtractionError(archive, e.what());
  } catch (const std::ios_base::failure &e) {
    throw ExtractionError(archive, e.what());
  }
  return extracted;
}

UnpackedDependencies unpackDependencies(const std::vector<Path> &archives,
                                        const Path &target,
                                        const std::string &extension) {
  const Path dir = fs::absolute(target);
  fs::create_directories(dir);
  UnpackedDependencies unpacked{dir, {}};
  for (const auto &archive : archives) {
    auto files = unpack(archive, dir, extension);
    if (!files.empty()) {
      auto log = logger::debug();
      log << "Extracted";
      for (const auto &file : files) log << "\n * " << file;
      log << std::endl;
    }
    unpacked.files.insert(unpacked.files.end(), files.begin(), files.end());
  }
  return unpacked;
}
}  // namespace protoDotCpp
