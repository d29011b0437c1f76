module;
#include <ostream>
#include <string>
#include <vector>

export module protoDotCpp.compiler.Protoc;
import protoDotCpp.compiler;
import protoDotCpp.sys.logger;
import protoDotCpp.sys.process;

namespace protoDotCpp {
export class Protoc : public Compiler {
 private:
  const std::string binary;

 public:
  explicit Protoc(const std::string &binary = "protoc") : binary(binary) {}

  std::string getName() const override { return "protoc"; }

  int execute(const std::vector<std::string> &args) const override {
    return process::run(binary, args, [](const std::string &line) {
      logger::info() << line << std::endl;
    });
  }
};
}  // namespace protoDotCpp
