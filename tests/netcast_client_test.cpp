#include <gtest/gtest.h>
#include "core/netcast_client.hpp"
#include "util/xml_tree.hpp"
#include "test_fakes.hpp"

using namespace testing_fakes;

static const char* AUTH_URL = "http://192.168.1.239:8080/roap/api/auth";

static std::string sessionXml(const std::string& session) {
    return "<?xml version=\"1.0\" encoding=\"utf-8\"?>"
           "<envelope><ROAPError>200</ROAPError><ROAPErrorDetail>OK</ROAPErrorDetail>"
           "<session>" + session + "</session></envelope>";
}

TEST(NetcastClientTest, BuildsRoapUrl) {
    NetcastClient client(nullptr, TV_HOST, std::nullopt);
    EXPECT_EQ(client.getUrl("auth"), AUTH_URL);

    NetcastClient v6(nullptr, "fe80::1", std::nullopt, 8081);
    EXPECT_EQ(v6.getUrl("auth"), "http://[fe80::1]:8081/roap/api/auth");
}

TEST(NetcastClientTest, MissingTokenRequestsPairingKey) {
    FakeRequester requester;
    requester.respond(AUTH_URL, 200, "");
    NetcastClient client(&requester, TV_HOST, std::nullopt);

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::AccessTokenError);
    EXPECT_TRUE(session.empty());

    auto calls = requester.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0].method, "POST");
    EXPECT_NE(calls[0].body.find("<type>AuthKeyReq</type>"), std::string::npos);
    ASSERT_EQ(calls[0].headers.size(), 1u);
    EXPECT_EQ(calls[0].headers[0], "Content-Type: application/atom+xml");
}

TEST(NetcastClientTest, EmptyTokenCountsAsMissing) {
    FakeRequester requester;
    NetcastClient client(&requester, TV_HOST, std::string());

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::AccessTokenError);
    ASSERT_EQ(requester.calls().size(), 1u);
    EXPECT_NE(requester.calls()[0].body.find("AuthKeyReq"), std::string::npos);
}

TEST(NetcastClientTest, ValidTokenReturnsSession) {
    FakeRequester requester;
    requester.respond(AUTH_URL, 200, sessionXml("1234567890"));
    NetcastClient client(&requester, TV_HOST, std::string("123456"));

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::Success);
    EXPECT_EQ(session, "1234567890");

    auto calls = requester.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].body.find("<type>AuthReq</type><value>123456</value>"), std::string::npos);
}

TEST(NetcastClientTest, TokenIsEscapedInRequestBody) {
    FakeRequester requester;
    requester.respond(AUTH_URL, 401, "");
    NetcastClient client(&requester, TV_HOST, std::string("1<&2"));

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::AccessTokenError);

    auto calls = requester.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_NE(calls[0].body.find("<value>1&lt;&amp;2</value>"), std::string::npos);

    std::string parseError;
    EXPECT_TRUE(XmlTree::parse(calls[0].body, parseError).has_value()) << parseError;
}

TEST(NetcastClientTest, RejectedTokenIsAccessTokenError) {
    FakeRequester requester;
    requester.respond(AUTH_URL, 401, "");
    NetcastClient client(&requester, TV_HOST, std::string("000000"));

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::AccessTokenError);
}

TEST(NetcastClientTest, ServerErrorIsSessionIdError) {
    FakeRequester requester;
    requester.respond(AUTH_URL, 500, "");
    NetcastClient client(&requester, TV_HOST, std::string("123456"));

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::SessionIdError);
    EXPECT_FALSE(error.empty());
}

TEST(NetcastClientTest, UnreachableTvIsSessionIdError) {
    FakeRequester requester;
    NetcastClient client(&requester, TV_HOST, std::string("123456"));

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::SessionIdError);
    EXPECT_EQ(error, "Couldn't connect to server");
}

TEST(NetcastClientTest, ShortSessionIsSessionIdError) {
    FakeRequester requester;
    requester.respond(AUTH_URL, 200, sessionXml("1234"));
    NetcastClient client(&requester, TV_HOST, std::string("123456"));

    std::string session, error;
    EXPECT_EQ(client.getSessionId(session, error), SessionResult::SessionIdError);
}

TEST(NetcastClientTest, ParsesSessionElement) {
    EXPECT_EQ(NetcastClient::parseSessionId(sessionXml("  abcdefgh  ")), std::optional<std::string>("abcdefgh"));
    EXPECT_FALSE(NetcastClient::parseSessionId("<envelope></envelope>").has_value());
    EXPECT_FALSE(NetcastClient::parseSessionId("<envelope><session>").has_value());
}
