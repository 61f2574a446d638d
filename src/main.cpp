/* @file main.cpp
 * @brief reveilled entry point: `reveilled [config.json]`
 *
 * © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <exception>
#include <iostream>
#include <string>

// Reveille headers
#include "core/SystemCoordinator.hpp"

using reveille::core::SystemCoordinator;

int main(int argc, char** argv) {
  const std::string configPath = argc > 1 ? argv[1] : "config.json";

  // before any thread exists, so only run()'s sigwait sees SIGINT/SIGTERM
  SystemCoordinator::blockShutdownSignals();

  SystemCoordinator coordinator;
  try {
    coordinator.initialize(configPath);
  } catch (const std::exception& e) {
    std::cerr << "reveilled: " << e.what() << '\n';
    return 1;
  }

  coordinator.run();
  return 0;
}
