/**
 * @file CommandBridge.cpp
 * @brief Local HTTP bridge implementation (cpp-httplib)
 * @author Courier Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Courier. All rights reserved.
 */

#include <Courier/Shell/CommandBridge.hpp>
#include <Courier/Shell/Protocol.hpp>
#include <Courier/Core/Logger.hpp>
#include <Courier/Core/Types.hpp>

#include <httplib.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <thread>

namespace Courier::Shell {

namespace {
    constexpr const char* kJson = "application/json";

    void reply(httplib::Response& res, int status, const json& body) {
        res.status = status;
        res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), kJson);
    }
}

class CommandBridge::Impl {
public:
    Impl(Network::RequestForwarder& forwarder, EventBus& events)
        : m_forwarder(forwarder)
        , m_events(events) {
        registerRoutes();
    }

    ~Impl() {
        stop();
    }

    Result<uint16_t> start(const std::string& host, uint16_t port) {
        if (m_running.load()) {
            return ErrorCode::InvalidState;
        }

        int bound = -1;
        if (port == 0) {
            bound = m_server.bind_to_any_port(host.c_str());
        } else if (m_server.bind_to_port(host.c_str(), port)) {
            bound = port;
        }

        if (bound <= 0) {
            COURIER_LOG_ERROR_F("Command bridge failed to bind %s:%u", host.c_str(),
                                static_cast<unsigned>(port));
            return ErrorCode::BindFailed;
        }

        m_port = static_cast<uint16_t>(bound);
        m_running = true;

        m_thread = std::thread([this]() {
            if (!m_server.listen_after_bind()) {
                COURIER_LOG_ERROR("Command bridge listener exited with an error");
            }
            m_running = false;
        });

        // stop() is a no-op until the listener thread is inside its accept loop
        for (int i = 0; i < 200 && !m_server.is_running(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        COURIER_LOG_INFO_F("Command bridge listening on http://%s:%u", host.c_str(),
                           static_cast<unsigned>(bound));
        return static_cast<uint16_t>(bound);
    }

    void stop() {
        m_server.stop();
        if (m_thread.joinable()) {
            m_thread.join();
            COURIER_LOG_INFO("Command bridge stopped");
        }
        m_running = false;
        m_port = 0;
    }

    bool isRunning() const { return m_running.load(); }

    uint16_t port() const { return m_port.load(); }

private:
    void registerRoutes() {
        m_server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
            json response;
            response["status"] = "ok";
            response["version"] = VERSION_STRING;
            reply(res, 200, response);
        });

        m_server.Post("/invoke/fetch", [this](const httplib::Request& req, httplib::Response& res) {
            handleFetch(req, res);
        });

        m_server.Get("/events", [this](const httplib::Request& req, httplib::Response& res) {
            handleEvents(req, res);
        });

        m_server.Post("/instance/activate", [this](const httplib::Request& req, httplib::Response& res) {
            handleActivate(req, res);
        });
    }

    void handleFetch(const httplib::Request& req, httplib::Response& res) {
        auto request = parseRequestDescriptor(req.body);
        if (request.isFailure()) {
            COURIER_LOG_WARNING_F("Rejected fetch invocation: %s",
                                  std::string(getErrorMessage(request.error())).c_str());
            reply(res, 400, json("Invalid request."));
            return;
        }

        auto response = m_forwarder.forward(request.value());
        if (response.isFailure()) {
            reply(res, 500, json(std::string(Network::describeForwardError(response.error()))));
            return;
        }

        reply(res, 200, toJson(response.value()));
    }

    void handleEvents(const httplib::Request& req, httplib::Response& res) {
        uint64_t after = 0;
        if (req.has_param("after")) {
            const std::string value = req.get_param_value("after");
            auto [end, err] = std::from_chars(value.data(), value.data() + value.size(), after);
            if (err != std::errc() || end != value.data() + value.size()) {
                reply(res, 400, json("Invalid request."));
                return;
            }
        }

        json list = json::array();
        for (const auto& event : m_events.since(after)) {
            json entry;
            entry["seq"] = event.seq;
            entry["event"] = event.name;
            entry["payload"] = event.payload;
            list.push_back(std::move(entry));
        }

        reply(res, 200, list);
    }

    void handleActivate(const httplib::Request& req, httplib::Response& res) {
        auto notice = parseInstanceNotice(req.body);
        if (notice.isFailure()) {
            reply(res, 400, json("Invalid request."));
            return;
        }

        COURIER_LOG_INFO_F("Secondary instance started with %zu argument(s) in %s",
                           notice.value().args.size(), notice.value().cwd.c_str());

        m_events.emit(SINGLE_INSTANCE_EVENT, toJson(notice.value()));

        json response;
        response["status"] = "ok";
        reply(res, 200, response);
    }

    Network::RequestForwarder& m_forwarder;
    EventBus& m_events;

    httplib::Server m_server;
    std::thread m_thread;
    std::atomic<bool> m_running{false};
    std::atomic<uint16_t> m_port{0};
};

CommandBridge::CommandBridge(Network::RequestForwarder& forwarder, EventBus& events)
    : m_impl(std::make_unique<Impl>(forwarder, events)) {}

CommandBridge::~CommandBridge() = default;

Result<uint16_t> CommandBridge::start(const std::string& host, uint16_t port) {
    return m_impl->start(host, port);
}

void CommandBridge::stop() {
    m_impl->stop();
}

bool CommandBridge::isRunning() const {
    return m_impl->isRunning();
}

uint16_t CommandBridge::port() const {
    return m_impl->port();
}

} // namespace Courier::Shell
