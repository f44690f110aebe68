#define DOCTEST_CONFIG_IMPLEMENT
#include "logger.hpp"
#include <doctest/doctest.h>

int main(int argc, char **argv) {
  // Library code logs through spdlog's default logger until init() is called
  whohas::logger::set_level(whohas::logger::Level::off);

  doctest::Context context;
  context.applyCommandLine(argc, argv);
  return context.run();
}
