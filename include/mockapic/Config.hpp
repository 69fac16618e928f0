#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "mockapic/Duration.hpp"

namespace mockapic {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 3333;
    std::string home = "./requests";
    Duration maxDelay = std::chrono::seconds(60);
    int maxMocks = 0;                              // 0 keeps everything
    Duration cleanInterval = std::chrono::minutes(1);
    int workers = 64;
    bool showHelp = false;
};

// Looks up an environment variable; returns "" when unset.
using EnvLookup = std::function<std::string(const std::string&)>;

// Defaults, then MOCKAPIC_* environment variables, then command line flags.
// Throws ConfigError on unknown flags or bad values.
ServerConfig loadConfig(const std::vector<std::string>& args, const EnvLookup& env);
ServerConfig loadConfig(int argc, char** argv);

std::string usage(const std::string& program);

} // namespace mockapic
