#include "krep/cli/router.hpp"

int main(int argc, char** argv) {
  return krep::cli::Dispatch(argc, argv);
}
