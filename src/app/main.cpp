#include <iostream>
#include <cstdlib>

#include "pkbsync/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    pkbsync::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return pkbsync::cli::kExitSyncFailed;
  }
}
