#include "mockapic/Config.hpp"

#include <cctype>
#include <cstdlib>
#include <sstream>

namespace mockapic {

namespace {

int parseInt(const std::string& name, const std::string& value, int min, int max) {
    try {
        size_t used = 0;
        int v = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        if (v < min || v > max) {
            throw ConfigError(name + " must be between " + std::to_string(min) +
                              " and " + std::to_string(max) + ", got " + value);
        }
        return v;
    } catch (const ConfigError&) {
        throw;
    } catch (const std::exception&) {
        throw ConfigError(name + " is not a number: " + value);
    }
}

Duration parsePositiveDuration(const std::string& name, const std::string& value) {
    auto d = parseDuration(value);
    if (!d || *d < Duration::zero()) {
        throw ConfigError(name + " is not a valid duration: " + value);
    }
    return *d;
}

// Applies one setting by its flag name (without the leading dashes).
void apply(ServerConfig& cfg, const std::string& key, const std::string& value) {
    if (key == "host") {
        if (value.empty()) throw ConfigError("host must not be empty");
        cfg.host = value;
    } else if (key == "port") {
        cfg.port = parseInt("port", value, 1, 65535);
    } else if (key == "home") {
        if (value.empty()) throw ConfigError("home must not be empty");
        cfg.home = value;
    } else if (key == "max-delay") {
        cfg.maxDelay = parsePositiveDuration("max-delay", value);
    } else if (key == "max-mocks") {
        cfg.maxMocks = parseInt("max-mocks", value, 0, 100000000);
    } else if (key == "clean-interval") {
        cfg.cleanInterval = parsePositiveDuration("clean-interval", value);
        if (cfg.cleanInterval < std::chrono::seconds(1)) {
            throw ConfigError("clean-interval must be at least 1s");
        }
    } else if (key == "workers") {
        cfg.workers = parseInt("workers", value, 1, 4096);
    } else {
        throw ConfigError("unknown option --" + key);
    }
}

const char* const kKeys[] = {
    "host", "port", "home", "max-delay", "max-mocks", "clean-interval", "workers"
};

std::string envName(const std::string& key) {
    std::string out = "MOCKAPIC_";
    for (char c : key) {
        out.push_back(c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
    }
    return out;
}

} // namespace

ServerConfig loadConfig(const std::vector<std::string>& args, const EnvLookup& env) {
    ServerConfig cfg;

    if (env) {
        for (const char* key : kKeys) {
            auto value = env(envName(key));
            if (!value.empty()) apply(cfg, key, value);
        }
    }

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            cfg.showHelp = true;
            continue;
        }
        if (arg.rfind("--", 0) != 0) {
            throw ConfigError("unexpected argument " + arg);
        }

        std::string key = arg.substr(2);
        std::string value;
        auto eq = key.find('=');
        if (eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
        } else {
            if (i + 1 >= args.size()) throw ConfigError("missing value for --" + key);
            value = args[++i];
        }
        apply(cfg, key, value);
    }
    return cfg;
}

ServerConfig loadConfig(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);
    return loadConfig(args, [](const std::string& name) {
        const char* v = std::getenv(name.c_str());
        return v ? std::string(v) : std::string();
    });
}

std::string usage(const std::string& program) {
    ServerConfig d;
    std::ostringstream out;
    out << "Usage: " << program << " [options]\n"
        << "  --host <addr>             listen address (default " << d.host << ")\n"
        << "  --port <n>                listen port (default " << d.port << ")\n"
        << "  --home <dir>              mock storage directory (default " << d.home << ")\n"
        << "  --max-delay <duration>    cap for ?delay= (default " << formatDuration(d.maxDelay) << ")\n"
        << "  --max-mocks <n>           keep at most n mocks, 0 = unlimited (default " << d.maxMocks << ")\n"
        << "  --clean-interval <dur>    eviction period (default " << formatDuration(d.cleanInterval) << ")\n"
        << "  --workers <n>             request worker threads (default " << d.workers << ")\n"
        << "  -h, --help                show this help\n"
        << "Every option can also be set as MOCKAPIC_<OPTION>, e.g. MOCKAPIC_MAX_DELAY=30s.\n";
    return out.str();
}

} // namespace mockapic
