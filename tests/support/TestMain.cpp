#include <catch2/catch_session.hpp>
#include "../../include/Logger.h"

#include <cstdlib>
#include <string>

int main(int argc, char* argv[]) {
    // LOG_LEVEL=debug etc. makes the tests chatty; quiet by default
    const char* levelEnv = std::getenv("LOG_LEVEL");
    LogLevel level = Logger::parseLevel(levelEnv ? levelEnv : "", LogLevel::WARNING);

    const char* fileEnv = std::getenv("LOG_FILE");
    Logger::getInstance().init(level, true, fileEnv ? fileEnv : "");

    return Catch::Session().run(argc, argv);
}
