#include "devtask/cli/router.hpp"

int main(int argc, char** argv) {
  // Thin entrypoint; argument parsing and the exit-code contract live in the
  // CLI router.
  return devtask::cli::Dispatch(argc, argv);
}
