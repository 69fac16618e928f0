#include "mockapic/Config.hpp"
#include "TestSupport.hpp"

#include <map>

using namespace mockapic;
using namespace std::chrono_literals;

static EnvLookup envFrom(std::map<std::string, std::string> vars) {
    return [vars](const std::string& name) {
        auto it = vars.find(name);
        return it == vars.end() ? std::string() : it->second;
    };
}

int main() {
    // Defaults
    ServerConfig d = loadConfig({}, envFrom({}));
    expect(d.host == "0.0.0.0" && d.port == 3333, "default address");
    expect(d.home == "./requests", "default home");
    expect(d.maxDelay == Duration(60s), "default max delay");
    expect(d.maxMocks == 0, "unlimited by default");
    expect(d.cleanInterval == Duration(1min), "default clean interval");
    expect(!d.showHelp, "no help by default");

    // Environment
    ServerConfig e = loadConfig({}, envFrom({
        {"MOCKAPIC_PORT", "4333"},
        {"MOCKAPIC_HOME", "/tmp/mocks"},
        {"MOCKAPIC_MAX_DELAY", "30s"},
        {"MOCKAPIC_MAX_MOCKS", "500"},
        {"MOCKAPIC_CLEAN_INTERVAL", "5m"},
    }));
    expect(e.port == 4333 && e.home == "/tmp/mocks", "env address and home");
    expect(e.maxDelay == Duration(30s) && e.maxMocks == 500, "env limits");
    expect(e.cleanInterval == Duration(5min), "env clean interval");

    // Command line wins over environment, both flag forms
    ServerConfig c = loadConfig({"--port", "8080", "--max-delay=1500ms", "--workers", "4"},
                                envFrom({{"MOCKAPIC_PORT", "4333"}, {"MOCKAPIC_MAX_DELAY", "30s"}}));
    expect(c.port == 8080, "flag over env");
    expect(c.maxDelay == Duration(1500ms), "--key=value form");
    expect(c.workers == 4, "workers");

    expect(loadConfig({"--help"}, envFrom({})).showHelp, "--help");
    expect(loadConfig({"-h"}, envFrom({})).showHelp, "-h");

    // Errors
    expect(throwsAs<ConfigError>([] { loadConfig({"--port", "http"}, envFrom({})); }), "port not a number");
    expect(throwsAs<ConfigError>([] { loadConfig({"--port", "70000"}, envFrom({})); }), "port out of range");
    expect(throwsAs<ConfigError>([] { loadConfig({"--port"}, envFrom({})); }), "missing value");
    expect(throwsAs<ConfigError>([] { loadConfig({"--max-delay", "forever"}, envFrom({})); }), "bad duration");
    expect(throwsAs<ConfigError>([] { loadConfig({"--max-delay", "-1s"}, envFrom({})); }), "negative duration");
    expect(throwsAs<ConfigError>([] { loadConfig({"--clean-interval", "10ms"}, envFrom({})); }), "interval too short");
    expect(throwsAs<ConfigError>([] { loadConfig({"--max-mocks", "-1"}, envFrom({})); }), "negative limit");
    expect(throwsAs<ConfigError>([] { loadConfig({"--verbose", "1"}, envFrom({})); }), "unknown flag");
    expect(throwsAs<ConfigError>([] { loadConfig({"serve"}, envFrom({})); }), "positional argument");
    expect(throwsAs<ConfigError>([] { loadConfig({}, envFrom({{"MOCKAPIC_WORKERS", "0"}})); }), "bad env value");

    expect(usage("mockapic").find("--max-delay") != std::string::npos, "usage lists flags");

    std::cout << "All tests passed." << std::endl;
    return 0;
}
