#include <boost/json.hpp>
#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <vector>

import protoDotCpp.project.Settings;
import protoDotCpp.test.TestUtils;
import protoDotCpp.utils;

#include "alias.hpp"

using namespace protoDotCpp;
using namespace protoDotCpp::test;

namespace {
Settings parse(const std::string &text, const Path &base = "/work") {
  return Settings::parse(json::parse(text), base);
}
}  // namespace

TEST(SettingsTest, DefaultsFollowTheConventionalLayout) {
  const auto settings = parse("{}");
  EXPECT_EQ(settings.sourceDirectories,
            std::vector<Path>{"/work/src/main/protobuf"});
  EXPECT_EQ(settings.externalIncludePath, "/work/target/protobuf_external");
  EXPECT_EQ(settings.cacheDirectory, "/work/target/cache");
  EXPECT_EQ(settings.protoc, "protoc");
  EXPECT_EQ(settings.schemaExtension, ".proto");
  ASSERT_EQ(settings.generatedTargets.size(), 1u);
  EXPECT_EQ(settings.generatedTargets[0].directory,
            "/work/target/src_managed/main/compiled_protobuf");
  EXPECT_EQ(settings.generatedTargets[0].pattern, "*.java");
  EXPECT_EQ(settings.getCompilerOptions(),
            std::vector<std::string>{
                "--java_out=/work/target/src_managed/main/compiled_protobuf"});
}

TEST(SettingsTest, PartialConfigKeepsOtherDefaults) {
  const auto settings = parse(R"({
    "protoc": "/opt/protobuf/bin/protoc",
    "protocOptions": ["--experimental_allow_proto3_optional"],
    "dependencies": ["lib/api.jar", "/abs/common.jar"]
  })");
  EXPECT_EQ(settings.protoc, "/opt/protobuf/bin/protoc");
  EXPECT_EQ(settings.protocOptions,
            std::vector<std::string>{"--experimental_allow_proto3_optional"});
  EXPECT_EQ(settings.dependencies,
            (std::vector<Path>{"/work/lib/api.jar", "/abs/common.jar"}));
  EXPECT_EQ(settings.sourceDirectories,
            std::vector<Path>{"/work/src/main/protobuf"});
}

TEST(SettingsTest, OneEmitFlagPerKnownOutputKind) {
  const auto settings = parse(R"({
    "generatedTargets": [
      {"directory": "gen/java", "pattern": "*.java"},
      {"directory": "gen/py", "pattern": "*_pb2.py"},
      {"directory": "gen/more-java", "pattern": "*.java"},
      {"directory": "gen/cpp", "pattern": "*.pb.cc"},
      {"directory": "gen/cpp", "pattern": "*.pb.h"},
      {"directory": "gen/docs", "pattern": "*.md"}
    ],
    "protocOptions": ["--x"]
  })");
  EXPECT_EQ(settings.getCompilerOptions(),
            (std::vector<std::string>{
                "--java_out=/work/gen/java",
                "--python_out=/work/gen/py",
                "--cpp_out=/work/gen/cpp",
                "--x",
            }));
  EXPECT_EQ(settings.getTargetDirectories().size(), 6u);
}

TEST(SettingsTest, GeneratedTargetsWithoutKnownKindAddNoFlag) {
  const auto settings = parse(R"({
    "generatedTargets": [{"directory": "gen", "pattern": "*.desc"}]
  })");
  EXPECT_TRUE(settings.getCompilerOptions().empty());
  EXPECT_TRUE(settings.generatedTargets[0].getOutputFlag().empty());
}

TEST(SettingsTest, IncludePathsEndWithTheExternalDirectory) {
  EXPECT_EQ(parse("{}").getIncludePaths(),
            (std::vector<Path>{"/work/src/main/protobuf",
                               "/work/target/protobuf_external"}));

  const auto settings = parse(R"({
    "includePaths": ["third_party", "src/main/protobuf", "third_party"],
    "externalIncludePath": "deps"
  })");
  EXPECT_EQ(settings.getIncludePaths(),
            (std::vector<Path>{"/work/third_party", "/work/src/main/protobuf",
                               "/work/deps"}));
}

TEST(SettingsTest, SchemaDirectoriesIncludeTheExternalDirectory) {
  const auto settings = parse(R"({"sourceDirectories": ["a", "b"]})");
  EXPECT_EQ(settings.getSchemaDirectories(),
            (std::vector<Path>{"/work/a", "/work/b",
                               "/work/target/protobuf_external"}));
}

TEST(SettingsTest, WrongTypeIsRejected) {
  EXPECT_THROW(parse(R"({"protoc": 3})"), InvalidJsonMember);
  EXPECT_THROW(parse(R"({"generatedTargets": [{"directory": "gen"}]})"),
               InvalidJsonMember);
}

TEST(SettingsTest, CreateResolvesAgainstTheConfigDirectory) {
  TempDir tmp;
  writeFile(tmp / "proto.json", R"({"sourceDirectories": ["schemas"]})");
  const auto settings = Settings::create(tmp / "proto.json");
  EXPECT_EQ(settings.sourceDirectories, std::vector<Path>{tmp / "schemas"});
  EXPECT_EQ(settings.cacheDirectory, tmp / "target/cache");
}

TEST(SettingsTest, CreateFailsWithoutConfig) {
  TempDir tmp;
  EXPECT_THROW(Settings::create(tmp / "proto.json"), ConfigNotFound);
}
