#include <gtest/gtest.h>
#include "api/engine_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <thread>

using json = nlohmann::json;

TEST(EngineClientTest, TestConnectionNoServer) {
    EngineClient client("127.0.0.1", 1, 1); // Port 1 = unlikely to have server
    EXPECT_FALSE(client.test_connection());
}

TEST(EngineClientTest, SetTrafficActiveNoServer) {
    EngineClient client("127.0.0.1", 1, 1);
    std::string err;
    EXPECT_FALSE(client.set_traffic_active(true, err));
    EXPECT_FALSE(err.empty());
}

// ── Against a local control endpoint ────────────────────────

class EngineClientServerTest : public ::testing::Test {
protected:
    httplib::Server server;
    std::thread thread;
    int port = -1;
    std::atomic<int> posts{0};
    std::atomic<bool> last_active{false};
    int reply_status = 204;

    void SetUp() override {
        server.Post("/_relay/traffic_active", [this](const httplib::Request& req, httplib::Response& res) {
            auto body = json::parse(req.body, nullptr, false);
            if (body.is_object()) last_active = body.value("active", false);
            ++posts;
            res.status = reply_status;
        });
        server.Get("/_relay/ping", [](const httplib::Request&, httplib::Response& res) {
            res.status = 404;
        });
        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        thread = std::thread([this]() { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    void TearDown() override {
        server.stop();
        if (thread.joinable()) thread.join();
    }
};

TEST_F(EngineClientServerTest, AnyAnswerCountsAsConnected) {
    EngineClient client("127.0.0.1", port);
    EXPECT_TRUE(client.test_connection());
}

TEST_F(EngineClientServerTest, PostsActiveFlag) {
    EngineClient client("127.0.0.1", port);
    std::string err;
    ASSERT_TRUE(client.set_traffic_active(true, err)) << err;
    EXPECT_TRUE(last_active.load());
    ASSERT_TRUE(client.set_traffic_active(false, err)) << err;
    EXPECT_FALSE(last_active.load());
    EXPECT_EQ(posts.load(), 2);
}

TEST_F(EngineClientServerTest, ErrorStatusIsReported) {
    reply_status = 500;
    EngineClient client("127.0.0.1", port);
    std::string err;
    EXPECT_FALSE(client.set_traffic_active(true, err));
    EXPECT_NE(err.find("500"), std::string::npos);
}
