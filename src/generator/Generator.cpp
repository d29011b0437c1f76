module;
#include <exception>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

module protoDotCpp.generator.Generator;
import protoDotCpp.cache.FileCache;
import protoDotCpp.compiler;
import protoDotCpp.generator.OutputCollector;
import protoDotCpp.generator.SchemaDiscovery;
import protoDotCpp.project.Settings;
import protoDotCpp.sys.logger;
import protoDotCpp.unpack.DependencyUnpacker;

#include "alias.hpp"

namespace protoDotCpp {
UnpackedDependencies Generator::unpackDependencies() const {
  return protoDotCpp::unpackDependencies(settings.dependencies,
                                         settings.externalIncludePath,
                                         settings.schemaExtension);
}

std::set<Path> Generator::discoverSchemas() const {
  return protoDotCpp::discoverSchemas(settings.getSchemaDirectories(),
                                      settings.schemaExtension);
}

std::set<Path> Generator::compile(const std::set<Path> &schemas) const {
  const auto targetDirs = settings.getTargetDirectories();
  for (const auto &dir : targetDirs) fs::create_directories(dir);

  const auto options = settings.getCompilerOptions();
  {
    auto log = logger::blue();
    log << "Compiling " << schemas.size() << " protobuf files to ";
    for (std::size_t i = 0; i < targetDirs.size(); i++)
      log << (i == 0 ? "" : ",") << targetDirs[i];
    log << std::endl;
  }
  logger::debug() << compiler->getName() << " options:" << std::endl;
  for (const auto &option : options)
    logger::debug() << "\t" << option << std::endl;
  for (const auto &schema : schemas)
    logger::info() << "Compiling schema " << schema << std::endl;

  const int exitCode =
      compiler->compile(settings.getIncludePaths(), options, schemas);
  if (exitCode != 0) throw CompileError(exitCode);

  for (const auto &dir : targetDirs)
    logger::info() << "Protoc target directory: " << dir << std::endl;
  return collectOutputs(settings.generatedTargets);
}

GenerateResult Generator::generate() const {
  try {
    unpackDependencies();
    const auto schemas = discoverSchemas();
    const FileCache cache(settings.cacheDirectory / "protobuf");
    const auto outputs = cache.evaluate(
        schemas, [&](const std::set<Path> &inputs) { return compile(inputs); });
    return std::vector<Path>(outputs.begin(), outputs.end());
  } catch (const ExtractionError &e) {
    return GenerateError{GenerateError::ExtractionFailure, e.what()};
  } catch (const LaunchError &e) {
    return GenerateError{GenerateError::LaunchFailure, e.what()};
  } catch (const CompileError &e) {
    return GenerateError{GenerateError::CompileFailure, e.what(),
                         e.getExitCode()};
  }
}

void Generator::clean() const {
  for (const auto &dir : settings.getTargetDirectories()) fs::remove_all(dir);
  fs::remove_all(settings.externalIncludePath);
  FileCache(settings.cacheDirectory / "protobuf").clear();
}
}  // namespace protoDotCpp
