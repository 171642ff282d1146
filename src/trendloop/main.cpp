#include "trendloop/cli/router.hpp"

int main(int argc, char** argv) {
  // Command parsing and the exit-code contract live in the CLI router.
  return trendloop::cli::Dispatch(argc, argv);
}
