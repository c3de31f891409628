#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/converter.hpp"

using chadoxml::observability::StringField;

int main(int argc, char** argv) {
  if (argc < 2 || argc > 3) {
    std::cerr << "Usage: idf2chadoxml <experiment.yaml> [output.xml]" << std::endl;
    return chadoxml::runtime::kExitInvalid;
  }

  const std::string input  = argv[1];
  const std::string output = argc == 3 ? argv[2] : "";

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = chadoxml::config::ConfigLoader::LoadFromEnvironment();
    chadoxml::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (cache, policy, stages) and run
    // ------------------------------------------------------------
    auto      app = chadoxml::factory::Build(config);
    const int rc  = chadoxml::runtime::Convert(app, input, output);

    chadoxml::observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    CHADOXML_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    chadoxml::observability::ShutdownLogging();
    return chadoxml::runtime::kExitFatal;
  }
}
