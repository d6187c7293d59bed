#include "cosmicam/cli/router.hpp"

int main(int argc, char** argv) {
  return cosmicam::cli::Dispatch(argc, argv);
}
