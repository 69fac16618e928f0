#include "MockapicHttpServer.hpp"

#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <thread>

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
    g_running = 0;
}

int main(int argc, char** argv) {
    mockapic::ServerConfig config;
    try {
        config = mockapic::loadConfig(argc, argv);
    } catch (const mockapic::ConfigError& e) {
        std::cerr << "Invalid configuration: " << e.what() << "\n\n"
                  << mockapic::usage(argv[0]);
        return 1;
    }
    if (config.showHelp) {
        std::cout << mockapic::usage(argv[0]);
        return 0;
    }

    try {
        auto mocker = std::make_shared<mockapic::MockService>(config.home);
        MockapicHttpServer app(config, mocker);
        app.bind();

        // Register signal handlers before serving to avoid a race window.
        std::signal(SIGINT, HandleSignal);
        std::signal(SIGTERM, HandleSignal);

        std::cout << "Starting server...\n";
        std::exception_ptr failure;
        std::thread serving([&app, &failure] {
            try {
                app.run();
            } catch (...) {
                failure = std::current_exception();
            }
            g_running = 0;
        });

        while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::cout << "Shutting down...\n";
        app.stop();
        serving.join();
        if (failure) std::rethrow_exception(failure);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
