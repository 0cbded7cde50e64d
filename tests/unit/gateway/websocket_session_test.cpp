#include <gtest/gtest.h>

#include <mcpbridge/gateway/websocket_session.h>

#include "../../common/fake_backend.h"

using namespace mcpbridge;
using namespace mcpbridge::gateway;
using mcpbridge::test::FakeBackend;

namespace {

class WebSocketSessionTest : public ::testing::Test {
protected:
    WebSocketSessionTest()
        : backend_(std::make_shared<FakeBackend>()),
          translator_(std::make_shared<bridge::ProtocolTranslator>(backend_)),
          auth_(std::make_shared<const ApiKeyAuthenticator>(std::set<std::string>{"ws-key"})) {
        backend_->addServer("time", {"now"});
    }

    WebSocketSession authed() { return WebSocketSession(translator_, auth_, std::string("ws-key")); }

    std::shared_ptr<FakeBackend> backend_;
    std::shared_ptr<bridge::ProtocolTranslator> translator_;
    std::shared_ptr<const ApiKeyAuthenticator> auth_;
};

} // namespace

TEST_F(WebSocketSessionTest, ConnectKeyAuthenticates) {
    EXPECT_TRUE(authed().authenticated());
    EXPECT_FALSE(WebSocketSession(translator_, auth_, std::string("nope")).authenticated());
    EXPECT_FALSE(WebSocketSession(translator_, auth_).authenticated());
}

TEST_F(WebSocketSessionTest, AuthMessageUnlocksSession) {
    WebSocketSession session(translator_, auth_);
    auto out = session.onMessage(R"({"type":"auth","apiKey":"ws-key"})");
    ASSERT_TRUE(out.reply.has_value());
    EXPECT_EQ(*out.reply, (json{{"type", "auth"}, {"status", "success"}}));
    EXPECT_FALSE(out.close);
    EXPECT_TRUE(session.authenticated());

    auto list = session.onMessage(R"({"type":"servers.list"})");
    EXPECT_EQ((*list.reply)["type"], "servers.list");
}

TEST_F(WebSocketSessionTest, BadKeyClosesConnection) {
    WebSocketSession session(translator_, auth_);
    auto out = session.onMessage(R"({"type":"auth","apiKey":"wrong"})");
    EXPECT_EQ(*out.reply, (json{{"type", "error"}, {"error", "Unauthorized"}}));
    EXPECT_TRUE(out.close);
    EXPECT_FALSE(session.authenticated());
}

TEST_F(WebSocketSessionTest, AnythingBeforeAuthClosesConnection) {
    WebSocketSession first(translator_, auth_);
    auto out = first.onMessage(R"({"type":"servers.list"})");
    EXPECT_EQ((*out.reply)["error"], "Unauthorized");
    EXPECT_TRUE(out.close);

    WebSocketSession second(translator_, auth_);
    auto garbage = second.onMessage("not json at all");
    EXPECT_EQ((*garbage.reply)["error"], "Unauthorized");
    EXPECT_TRUE(garbage.close);
    EXPECT_EQ(backend_->serverListCalls(), 0);
}

TEST_F(WebSocketSessionTest, ServersListPassesDaemonBodyThrough) {
    auto session = authed();
    auto out = session.onMessage(R"({"type":"servers.list"})");
    ASSERT_TRUE(out.reply.has_value());
    EXPECT_EQ((*out.reply)["data"]["servers"][0]["name"], "time");
}

TEST_F(WebSocketSessionTest, ToolsListRequiresServer) {
    auto session = authed();
    auto missing = session.onMessage(R"({"type":"tools.list","id":"a"})");
    EXPECT_EQ(*missing.reply,
              (json{{"type", "error"}, {"error", "Server is required"}, {"id", "a"}}));
    EXPECT_FALSE(missing.close);

    auto ok = session.onMessage(R"({"type":"tools.list","server":"time"})");
    EXPECT_EQ((*ok.reply)["type"], "tools.list");
    EXPECT_EQ((*ok.reply)["server"], "time");
    EXPECT_EQ((*ok.reply)["data"]["tools"][0]["name"], "now");

    auto unknown = session.onMessage(R"({"type":"tools.list","server":"ghost"})");
    EXPECT_EQ((*unknown.reply)["type"], "error");
}

TEST_F(WebSocketSessionTest, ListRepliesEchoCorrelationId) {
    auto session = authed();
    auto servers = session.onMessage(R"({"type":"servers.list","id":"c1"})");
    EXPECT_EQ((*servers.reply)["type"], "servers.list");
    EXPECT_EQ((*servers.reply)["id"], "c1");

    auto tools = session.onMessage(R"({"type":"tools.list","server":"time","id":"c2"})");
    EXPECT_EQ((*tools.reply)["type"], "tools.list");
    EXPECT_EQ((*tools.reply)["id"], "c2");

    // No id sent, none echoed
    auto plain = session.onMessage(R"({"type":"servers.list"})");
    EXPECT_FALSE(plain.reply->contains("id"));

    WebSocketSession fresh(translator_, auth_);
    auto auth = fresh.onMessage(R"({"type":"auth","apiKey":"ws-key","id":3})");
    EXPECT_EQ((*auth.reply)["status"], "success");
    EXPECT_EQ((*auth.reply)["id"], 3);
}

TEST_F(WebSocketSessionTest, ToolsCallEchoesIdWithResult) {
    backend_->onInvoke([](const FakeBackend::Invocation& inv) -> Result<json> {
        return json{{"echo", inv.arguments}};
    });
    auto session = authed();

    auto out = session.onMessage(
        R"({"type":"tools.call","id":7,"server":"time","tool":"now","params":{"tz":"UTC"}})");
    ASSERT_TRUE(out.reply.has_value());
    EXPECT_EQ((*out.reply)["type"], "tools.result");
    EXPECT_EQ((*out.reply)["id"], 7);
    EXPECT_EQ((*out.reply)["data"]["echo"]["tz"], "UTC");

    auto missing = session.onMessage(R"({"type":"tools.call","id":8,"server":"time"})");
    EXPECT_EQ((*missing.reply)["error"], "Server and tool are required");
    EXPECT_EQ((*missing.reply)["id"], 8);
}

TEST_F(WebSocketSessionTest, CallFailureBecomesErrorFrame) {
    backend_->onInvoke([](const FakeBackend::Invocation&) -> Result<json> {
        return Error{ErrorCode::BackendCallFailed, "Request failed with status code 500"};
    });
    auto session = authed();
    auto out = session.onMessage(R"({"type":"tools.call","id":1,"server":"time","tool":"now"})");
    EXPECT_EQ(*out.reply, (json{{"type", "error"},
                                {"error", "Request failed with status code 500"},
                                {"id", 1}}));
    EXPECT_FALSE(out.close);
}

TEST_F(WebSocketSessionTest, UnknownTypeAndBadJsonKeepConnectionOpen) {
    auto session = authed();
    auto unknown = session.onMessage(R"({"type":"resources.list"})");
    EXPECT_EQ((*unknown.reply)["error"], "Unknown message type: resources.list");
    EXPECT_FALSE(unknown.close);

    auto bad = session.onMessage("{oops");
    EXPECT_EQ((*bad.reply)["type"], "error");
    EXPECT_FALSE(bad.close);

    auto array = session.onMessage("[1,2]");
    EXPECT_EQ((*array.reply)["error"], "Message must be a JSON object");
    EXPECT_FALSE(array.close);
}
