module;
#include <boost/describe.hpp>
#include <boost/json.hpp>
#include <exception>
#include <filesystem>
#include <string>
#include <type_traits>
#include <vector>

export module protoDotCpp.project.Settings;

#include "alias.hpp"
#include "macro.hpp"

namespace protoDotCpp {
export DEF_EXCEPTION(ConfigNotFound, (const Path &path),
                     "config file not found: " + path.generic_string());

// Where one kind of generated file lands and how to recognize it.
export struct GeneratedTarget {
  Path directory;
  std::string pattern;

  // The protoc flag emitting this kind of file, empty if unknown.
  std::string getOutputFlag() const;

 private:
  BOOST_DESCRIBE_CLASS(GeneratedTarget, (), (directory, pattern), (), ())
};

export struct Settings {
  std::vector<Path> sourceDirectories{"src/main/protobuf"};
  std::vector<Path> includePaths;
  Path externalIncludePath = "target/protobuf_external";
  std::string protoc = "protoc";
  std::vector<std::string> protocOptions;
  std::vector<GeneratedTarget> generatedTargets{
      {"target/src_managed/main/compiled_protobuf", "*.java"}};
  std::vector<Path> dependencies;
  Path cacheDirectory = "target/cache";
  std::string schemaExtension = ".proto";

  static Settings create(const Path &configPath);

  static Settings parse(const json::value &jv, const Path &base);

  // Makes every relative path relative to base.
  void resolve(const Path &base);

  std::vector<Path> getIncludePaths() const;

  std::vector<Path> getSchemaDirectories() const;

  std::vector<std::string> getCompilerOptions() const;

  std::vector<Path> getTargetDirectories() const;

 private:
  BOOST_DESCRIBE_CLASS(Settings, (),
                       (sourceDirectories, includePaths, externalIncludePath,
                        protoc, protocOptions, generatedTargets, dependencies,
                        cacheDirectory, schemaExtension),
                       (), ())
};
}  // namespace protoDotCpp

namespace boost {
namespace json {
template <>
struct is_described_class<protoDotCpp::GeneratedTarget> : std::true_type {};
template <>
struct is_described_class<protoDotCpp::Settings> : std::true_type {};
}  // namespace json
}  // namespace boost
