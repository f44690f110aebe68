#include "cli.hpp"
#include "config.hpp"
#include "logger.hpp"
#include <iostream>
#include <utility>

using namespace whohas;

int main(int argc, char *argv[]) {
  if (argc != 3 || !Cli::is_command(argv[1])) {
    std::cerr << USAGE << std::endl;
    return 1;
  }

  // Keep stdout clean until the configured sinks exist
  logger::set_level(logger::Level::off);

  try {
    auto config = config::load(argv[2]);

    logger::set_level(config.log.level);
    logger::enable_console(config.log.console);
    logger::init("whohas", config.log.file);
    LOG_INFO("whohas started with {}", argv[2]);

    Cli cli(std::move(config));
    cli.run(argv[1]);
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    std::cerr << "ERROR: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
