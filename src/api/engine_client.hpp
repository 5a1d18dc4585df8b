#pragma once

#include <memory>
#include <string>

/// Control channel into a running engine. The engine serves these routes on
/// its proxy port alongside the traffic it intercepts.
class EngineClient {
public:
    explicit EngineClient(const std::string& host, int port, int timeout_sec = 2);
    ~EngineClient();

    /// Any HTTP answer on the control port
    bool test_connection();

    /// POST /_relay/traffic_active {"active": <bool>}
    bool set_traffic_active(bool active, std::string& err);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
