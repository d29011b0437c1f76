#include <boost/program_options.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

import protoDotCpp.compiler.Protoc;
import protoDotCpp.generator.Generator;
import protoDotCpp.project.Settings;
import protoDotCpp.sys.logger;

#include "alias.hpp"

using namespace protoDotCpp;

namespace po = boost::program_options;

int main(int argc, const char** argv) {
  po::options_description od;
  po::variables_map vm;
  od.add_options()
      .operator()("help,h", "Display help message.")
      .operator()("config,c", po::value<Path>()->default_value("proto.json"),
                  "The config file.")
      .operator()("protoc", po::value<std::string>(),
                  "The protoc executable to use.")
      .operator()("clean", "Remove generated files and the cache.")
      .operator()("verbose,v", "Enable verbose output.");

  try {
    po::store(po::command_line_parser(argc, argv).options(od).run(), vm);
    po::notify(vm);

    if (vm.contains("help")) {
      std::cout << od << std::endl;
      return 0;
    }
    logger::setVerbose(vm.contains("verbose"));

    auto settings = Settings::create(vm["config"].as<Path>());
    const auto& vv = vm["protoc"];
    if (!vv.empty()) settings.protoc = vv.as<std::string>();

    const Generator generator(settings,
                              std::make_shared<Protoc>(settings.protoc));
    if (vm.contains("clean")) {
      generator.clean();
      logger::success() << "Cleaned" << std::endl;
      return 0;
    }

    const auto result = generator.generate();
    if (!result.ok()) {
      logger::error() << "error: " << result.getError().message << std::endl;
      return 1;
    }
    for (const auto& file : result.getFiles())
      logger::success() << "Generated " << file << std::endl;
    return 0;
  } catch (const std::exception& e) {
    logger::error() << "error: " << e.what() << std::endl;
    return 1;
  }
}
