#include <authbridge/server/config.hpp>
#include <authbridge/server/server.hpp>

#include <exception>
#include <iostream>

int main(int argc, char** argv) {
  try {
    // Defaults, then config file, environment, and flags
    auto config = authbridge::server::Config::LoadFromArgs(argc, argv);

    authbridge::server::Server server(config);
    server.Run();

    return 0;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
