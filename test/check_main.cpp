#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <procflow/util/logging.hpp>

int
main(int argc, char* argv[])
{
  procflow::log::reset_level(procflow::log::Level::off);

  int result = Catch::Session().run(argc, argv);
  return result;
}
