#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "utils/logger.hpp"

int main(int argc, char* argv[]) {
    // Keep test output readable; failures still show up through Catch
    rendezvous::Logger::getInstance().setMinLevel(rendezvous::LogLevel::ERROR);
    return Catch::Session().run(argc, argv);
}
