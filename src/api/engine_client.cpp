#include "api/engine_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

struct EngineClient::Impl {
    std::string host;
    int port;
    int timeout_sec;

    std::unique_ptr<httplib::Client> make_client() {
        auto cli = std::make_unique<httplib::Client>(host, port);
        cli->set_connection_timeout(timeout_sec, 0);
        cli->set_read_timeout(timeout_sec, 0);
        cli->set_write_timeout(timeout_sec, 0);
        return cli;
    }
};

EngineClient::EngineClient(const std::string& host, int port, int timeout_sec)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = host;
    impl_->port = port;
    impl_->timeout_sec = timeout_sec;
}

EngineClient::~EngineClient() = default;

bool EngineClient::test_connection() {
    auto cli = impl_->make_client();
    auto res = cli->Get("/_relay/ping");
    // Any HTTP answer means the engine is listening
    return static_cast<bool>(res);
}

bool EngineClient::set_traffic_active(bool active, std::string& err) {
    try {
        auto cli = impl_->make_client();
        json body;
        body["active"] = active;
        auto res = cli->Post("/_relay/traffic_active", body.dump(), "application/json");
        if (!res) {
            err = "Request failed: " + httplib::to_string(res.error());
            return false;
        }
        if (res->status != 200 && res->status != 204) {
            err = "Engine answered HTTP " + std::to_string(res->status);
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        err = e.what();
        return false;
    }
}
