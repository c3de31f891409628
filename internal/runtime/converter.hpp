#pragma once

#include <string>

#include "internal/factory.hpp"

namespace chadoxml::runtime {

enum ExitCode : int {
  kExitOk      = 0,
  kExitInvalid = 1, // usage error or failed validation
  kExitFatal   = 2, // cache consistency, serialization or configuration failure
};

/*
  Convert

  One validate-and-write run: load the experiment, run the stages, write
  ChadoXML to output (stdout when empty).

  Every path closes the progress blocks it opened and destroys the
  application's cache exactly once.
*/
int Convert(factory::Application& app, const std::string& input, const std::string& output);

} // namespace chadoxml::runtime
