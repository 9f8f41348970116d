#include "refinery/cli/router.hpp"

int main(int argc, char** argv) {
  return refinery::cli::Dispatch(argc, argv);
}
