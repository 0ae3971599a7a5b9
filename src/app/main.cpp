#include <iostream>

#include "snip/cli/application.hpp"

int main(int argc, char* argv[]) {
  try {
    snip::cli::Application app;
    return app.run(argc, argv);
  } catch (const std::exception& e) {
    std::cerr << "Fatal error: " << e.what() << std::endl;
    return 1;
  }
}
