#pragma once

#include <memory>
#include <string>
#include <thread>
#include "httplib.h"
#include "MockService.hpp"
#include "mockapic/Cancellation.hpp"
#include "mockapic/Config.hpp"
#include "mockapic/ResponseWriter.hpp"

class MockapicHttpServer {
public:
    MockapicHttpServer(mockapic::ServerConfig config, std::shared_ptr<mockapic::Mocker> mocker);
    ~MockapicHttpServer();

    // Binds the listening socket; port 0 picks a free one. Returns the port.
    int bind();

    // Serves until stop(). Binds first if bind() was not called.
    void run();

    // Cancels pending delayed responses and the janitor, then stops serving.
    void stop();

    bool isRunning() const { return server_.is_running(); }
    int port() const { return port_; }

private:
    void setupRoutes();
    void janitorLoop();

    mockapic::ServerConfig config_;
    std::shared_ptr<mockapic::Mocker> mocker_;
    mockapic::ResponseWriter writer_;
    mockapic::CancellationSource cancel_;
    httplib::Server server_;
    std::thread janitor_;
    int port_ = -1;
};
