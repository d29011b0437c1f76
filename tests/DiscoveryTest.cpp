#include <gtest/gtest.h>

#include <filesystem>
#include <set>
#include <string>
#include <vector>

import protoDotCpp.fileProvider.Glob;
import protoDotCpp.generator.OutputCollector;
import protoDotCpp.generator.SchemaDiscovery;
import protoDotCpp.project.Settings;
import protoDotCpp.test.TestUtils;

#include "alias.hpp"

using namespace protoDotCpp;
using namespace protoDotCpp::test;

TEST(GlobTest, MatchesTopLevelAndNestedFiles) {
  TempDir tmp;
  writeFile(tmp / "top.proto", "");
  writeFile(tmp / "a/b/c/deep.proto", "");
  writeFile(tmp / "a/notes.txt", "");

  EXPECT_EQ(Glob(tmp.get(), "*.proto").list(),
            (std::set<Path>{tmp / "top.proto", tmp / "a/b/c/deep.proto"}));
  EXPECT_EQ(Glob(tmp.get(), "*.proto").setRecursive(false).list(),
            std::set<Path>{tmp / "top.proto"});
}

TEST(GlobTest, MissingDirectoryListsNothing) {
  TempDir tmp;
  EXPECT_TRUE(Glob(tmp / "missing", "*").list().empty());
}

TEST(GlobTest, GlobCharactersInBaseAreLiteral) {
  TempDir tmp;
  writeFile(tmp / "a[1]/x.proto", "");
  writeFile(tmp / "a[1]/nested/y.proto", "");
  writeFile(tmp / "a1/decoy.proto", "");
  writeFile(tmp / "b*?/z.proto", "");
  writeFile(tmp / "bcd/decoy.proto", "");

  EXPECT_EQ(Glob(tmp / "a[1]", "*.proto").list(),
            (std::set<Path>{tmp / "a[1]/nested/y.proto", tmp / "a[1]/x.proto"}));
  EXPECT_EQ(Glob(tmp / "b*?", "*.proto").list(),
            std::set<Path>{tmp / "b*?/z.proto"});
}

TEST(SchemaDiscoveryTest, FindsSchemasInEveryDirectory) {
  TempDir tmp;
  writeFile(tmp / "src/main/protobuf/user.proto", "");
  writeFile(tmp / "src/main/protobuf/billing/invoice.proto", "");
  writeFile(tmp / "src/main/protobuf/README.md", "");
  writeFile(tmp / "external/google/type/date.proto", "");

  const auto schemas = discoverSchemas(
      {tmp / "src/main/protobuf", tmp / "external", tmp / "missing"},
      ".proto");

  EXPECT_EQ(schemas, (std::set<Path>{
                         tmp / "external/google/type/date.proto",
                         tmp / "src/main/protobuf/billing/invoice.proto",
                         tmp / "src/main/protobuf/user.proto",
                     }));
  for (const auto &schema : schemas) EXPECT_TRUE(schema.is_absolute());
}

TEST(SchemaDiscoveryTest, OverlappingDirectoriesAreDeduplicated) {
  TempDir tmp;
  writeFile(tmp / "root/sub/x.proto", "");

  const auto schemas =
      discoverSchemas({tmp / "root", tmp / "root/sub"}, ".proto");

  EXPECT_EQ(schemas, std::set<Path>{tmp / "root/sub/x.proto"});
}

TEST(SchemaDiscoveryTest, SourceDirectoryWithBracketsInItsPath) {
  TempDir tmp;
  writeFile(tmp / "job[3]/src/main/protobuf/user.proto", "");

  EXPECT_EQ(discoverSchemas({tmp / "job[3]/src/main/protobuf"}, ".proto"),
            std::set<Path>{tmp / "job[3]/src/main/protobuf/user.proto"});
  EXPECT_EQ(collectOutputs({{tmp / "job[3]/src", "*.proto"}}),
            std::set<Path>{tmp / "job[3]/src/main/protobuf/user.proto"});
}

TEST(OutputCollectorTest, UnitesEveryTargetIncludingStrayFiles) {
  TempDir tmp;
  writeFile(tmp / "java/com/acme/User.java", "");
  writeFile(tmp / "java/Stray.java", "");
  writeFile(tmp / "java/notes.txt", "");
  writeFile(tmp / "py/user_pb2.py", "");
  writeFile(tmp / "py/__init__.py.bak", "");

  const auto outputs = collectOutputs({{tmp / "java", "*.java"},
                                       {tmp / "py", "*_pb2.py"},
                                       {tmp / "nothing", "*.cc"}});

  EXPECT_EQ(outputs, (std::set<Path>{
                         tmp / "java/Stray.java",
                         tmp / "java/com/acme/User.java",
                         tmp / "py/user_pb2.py",
                     }));
}
