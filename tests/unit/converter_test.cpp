#include "internal/runtime/converter.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

namespace {

using chadoxml::config::ConfigLoader;
using chadoxml::runtime::Convert;
namespace fs = std::filesystem;

const char* kValid = R"(
term_sources:
  - name: SO
features:
  - uniquename: F1
    type: {cv: SO, term: gene}
protocols:
  - id: P1
    name: grow
data:
  - id: D1
    features: [F1]
experiment:
  uniquename: E1
  applied_protocols:
    - - {protocol: P1, outputs: [D1]}
)";

fs::path Dir() {
  const auto dir = fs::temp_directory_path() / "chadoxml_converter_tests";
  fs::create_directories(dir);
  return dir;
}

fs::path WriteInput(const std::string& name, const std::string& yaml) {
  const auto    path = Dir() / name;
  std::ofstream out(path, std::ios::trunc);
  out << yaml;
  return path;
}

std::string ReadFile(const fs::path& path) {
  std::ifstream      in(path);
  std::ostringstream content;
  content << in.rdbuf();
  return content.str();
}

// Runs one conversion on a fresh application and checks the cleanup every
// path must do.
int Run(const fs::path& input, const fs::path& output) {
  auto      app = chadoxml::factory::Build(ConfigLoader::Defaults());
  const int rc  = Convert(app, input.string(), output.string());

  assert(app.cache->IsDestroyed());
  assert(chadoxml::observability::NestingDepth() == 0);
  return rc;
}

void TestValidExperimentIsWritten() {
  const auto output = Dir() / "valid.xml";
  fs::remove(output);

  assert(Run(WriteInput("valid.yaml", kValid), output) == chadoxml::runtime::kExitOk);

  const auto xml = ReadFile(output);
  assert(xml.find("<chadoxml>") != std::string::npos);
  assert(xml.find("<uniquename>E1</uniquename>") != std::string::npos);
}

void TestMalformedDocumentFailsValidation() {
  const auto output = Dir() / "malformed.xml";
  fs::remove(output);

  assert(Run(WriteInput("malformed.yaml", "term_sources: []\n"), output) == chadoxml::runtime::kExitInvalid);
  assert(Run(Dir() / "missing.yaml", output) == chadoxml::runtime::kExitInvalid);
  assert(!fs::exists(output));
}

void TestFailingStageFailsValidation() {
  const auto output = Dir() / "undeclared.xml";
  fs::remove(output);

  // CV "MO" has no term source
  const std::string yaml = std::string(kValid) + "  properties:\n    - {name: Lab, type: {cv: MO, term: lab}}\n";
  assert(Run(WriteInput("undeclared.yaml", yaml), output) == chadoxml::runtime::kExitInvalid);
  assert(!fs::exists(output));
}

void TestUnwritableOutputIsFatal() {
  const auto output = Dir() / "missing-dir" / "out.xml";
  assert(Run(WriteInput("fatal.yaml", kValid), output) == chadoxml::runtime::kExitFatal);
  assert(!fs::exists(output));
}

} // namespace

int main() {
  TestValidExperimentIsWritten();
  TestMalformedDocumentFailsValidation();
  TestFailingStageFailsValidation();
  TestUnwritableOutputIsFatal();

  std::cout << "chadoxml_unit_converter: pass\n";
  return 0;
}
