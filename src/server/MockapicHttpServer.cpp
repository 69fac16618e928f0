#include "MockapicHttpServer.hpp"

#include <iostream>
#include <stdexcept>

#include "mockapic/Errors.hpp"
#include "mockapic/Uuid.hpp"
#include "mockapic/Vocabulary.hpp"

using json = nlohmann::json;

namespace {

const char* kBanner =
    "mockapic - mock HTTP responses\n"
    "\n"
    "  POST /v1/new?status=200&contentType=text/plain&charset=UTF-8[&<header>=<value>...]\n"
    "       body of the request = body of the mocked response\n"
    "  GET  /v1/{uuid}[?delay=<duration>]\n"
    "  GET  /v1/list\n"
    "  GET  /static/content-types\n"
    "  GET  /static/charsets\n"
    "  GET  /static/status-codes\n";

} // namespace

MockapicHttpServer::MockapicHttpServer(mockapic::ServerConfig config, std::shared_ptr<mockapic::Mocker> mocker)
    : config_(std::move(config)), mocker_(std::move(mocker)), writer_(config_.maxDelay) {
    auto workers = static_cast<size_t>(config_.workers);
    server_.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
    setupRoutes();
}

MockapicHttpServer::~MockapicHttpServer() {
    stop();
    if (janitor_.joinable()) janitor_.join();
}

int MockapicHttpServer::bind() {
    if (port_ > 0) return port_;
    if (config_.port == 0) {
        port_ = server_.bind_to_any_port(config_.host.c_str());
    } else if (server_.bind_to_port(config_.host.c_str(), config_.port)) {
        port_ = config_.port;
    }
    if (port_ <= 0) {
        port_ = -1;
        throw std::runtime_error("cannot bind " + config_.host + ":" + std::to_string(config_.port));
    }
    return port_;
}

void MockapicHttpServer::run() {
    bind();

    if (config_.maxMocks > 0) {
        janitor_ = std::thread([this] { janitorLoop(); });
    }

    std::cout << "mockapic HTTP server listening on "
              << config_.host << ":" << port_
              << " home=" << config_.home
              << " maxDelay=" << mockapic::formatDuration(config_.maxDelay)
              << " maxMocks=" << config_.maxMocks << std::endl;
    bool ok = server_.listen_after_bind();
    bool stopRequested = cancel_.isCancelled();

    cancel_.cancel();
    if (janitor_.joinable()) janitor_.join();
    if (!ok && !stopRequested) {
        throw std::runtime_error("server on port " + std::to_string(port_) + " stopped unexpectedly");
    }
}

void MockapicHttpServer::stop() {
    cancel_.cancel();
    server_.stop();
}

void MockapicHttpServer::janitorLoop() {
    do {
        try {
            int removed = mocker_->clean(config_.maxMocks);
            if (removed > 0) {
                std::cerr << "MockapicHttpServer: evicted " << removed
                          << " mock(s) beyond limit " << config_.maxMocks << "\n";
            }
        } catch (const mockapic::MockError& e) {
            std::cerr << "MockapicHttpServer: clean failed: " << e.what() << "\n";
        }
    } while (cancel_.waitFor(config_.cleanInterval));
}

void MockapicHttpServer::setupRoutes() {

    // JSON helpers
    auto sendJson = [](httplib::Response& res, const json& data) {
        res.set_content(data.dump(), "application/json");
    };

    auto fail = [](httplib::Response& res, int code, const std::string& message) {
        res.status = code;
        res.set_content(json{{"message", message}}.dump(), "application/json");
    };

    // --- HOME ---
    server_.Get("/", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(kBanner, "text/plain; charset=UTF-8");
    });

    // --- REFERENCE DATA ---
    server_.Get("/static/content-types", [sendJson](const httplib::Request&, httplib::Response& res) {
        sendJson(res, mockapic::Vocabulary::contentTypes());
    });

    server_.Get("/static/charsets", [sendJson](const httplib::Request&, httplib::Response& res) {
        sendJson(res, mockapic::Vocabulary::charsets());
    });

    server_.Get("/static/status-codes", [sendJson](const httplib::Request&, httplib::Response& res) {
        json codes = json::object();
        for (const auto& kv : mockapic::Vocabulary::statusCodes()) {
            codes[std::to_string(kv.first)] = kv.second;
        }
        sendJson(res, codes);
    });

    // --- LIST --- (registered before /v1/{id} so "list" is not taken as an id)
    server_.Get("/v1/list", [this, sendJson, fail](const httplib::Request&, httplib::Response& res) {
        try {
            json items = json::array();
            for (const auto& summary : mocker_->list()) {
                items.push_back(mockapic::toJson(summary));
            }
            sendJson(res, items);
        } catch (const mockapic::MockError& e) {
            std::cerr << "MockapicHttpServer: list failed: " << e.what() << "\n";
            fail(res, 409, "error to list mocked responses");
        }
    });

    // --- NEW ---
    server_.Post("/v1/new", [this, sendJson, fail](const httplib::Request& req, httplib::Response& res) {
        mockapic::RequestParams params;
        for (const auto& kv : req.params) {
            params[kv.first].push_back(kv.second);
        }
        try {
            auto id = mocker_->create(params, req.body);
            sendJson(res, json{{"uuid", id}});
        } catch (const mockapic::MockError& e) {
            fail(res, 409, e.what());
        }
    });

    // --- GET MOCK ---
    server_.Get(R"(/v1/([^/]+))", [this, fail](const httplib::Request& req, httplib::Response& res) {
        std::string id = req.matches[1];
        mockapic::MockRecord record;
        try {
            mockapic::parseUUID(id);
            record = mocker_->get(id);
        } catch (const mockapic::NotFoundError& e) {
            fail(res, 404, e.what());
            return;
        } catch (const mockapic::MockError& e) {
            fail(res, 409, e.what());
            return;
        }

        if (writer_.write(record, req.get_param_value("delay"), res, cancel_, req.is_connection_closed)) {
            return;
        }
        if (cancel_.isCancelled()) {
            fail(res, 503, "server is shutting down");
        } else {
            std::cerr << "MockapicHttpServer: client left before mock " << id << " was sent\n";
        }
    });
}
