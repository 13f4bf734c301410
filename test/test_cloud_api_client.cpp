#include <gtest/gtest.h>
#include "../include/cloud_api_client.hpp"
#include "../include/exceptions.hpp"
#include "fakes.hpp"

namespace {

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

CloudCredentials credentials() {
    CloudCredentials c;
    c.username = "installer@example.com";
    c.password = "s3cret pass";
    c.base_url = "https://monitor.example.com/";
    c.plant_id = "4411";
    return c;
}

class CloudApiClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        http = std::make_shared<FakeHttpClient>();
        http->handler = [this](const RecordedRequest& req) {
            if (endsWith(req.url, "/WManage/api/login")) return loginResponse("SESSION" + std::to_string(++logins));
            if (endsWith(req.url, "/getInverterRuntime")) return runtime_reply;
            return jsonResponse(200, "{\"success\":true}");
        };
        client.reset(new CloudApiClient(credentials(), http, [this]() { return now; }));
    }

    std::shared_ptr<FakeHttpClient> http;
    std::unique_ptr<CloudApiClient> client;
    HttpResponse runtime_reply = jsonResponse(200,
        "{\"success\":true,\"serialNum\":\"1234567890\",\"ppv\":3200,\"vacr\":2417,\"soc\":81,"
        "\"fwCode\":\"FAAB-2525\",\"deviceType\":2092,\"lost\":false,\"pf\":0.98,\"nested\":{\"x\":1}}");
    std::time_t now = 1792303200;
    int logins = 0;
};

}  // namespace

TEST_F(CloudApiClientTest, LogsInOnceAndAttachesSessionCookie) {
    RawPayload p = client->readRuntime("1234567890");
    client->readRuntime("1234567890");
    EXPECT_EQ(1, logins);
    EXPECT_TRUE(client->hasSession());

    ASSERT_EQ(3u, http->requests.size());
    EXPECT_EQ("https://monitor.example.com/WManage/api/login", http->requests[0].url);
    EXPECT_EQ("account=installer%40example.com&password=s3cret+pass", http->requests[0].body);
    EXPECT_EQ("JSESSIONID=SESSION1", http->requests[1].headers["Cookie"]);
    EXPECT_EQ("serialNum=1234567890", http->requests[1].body);

    EXPECT_DOUBLE_EQ(3200, p.get("ppv").number);
    EXPECT_DOUBLE_EQ(0.98, p.get("pf").number);
    EXPECT_DOUBLE_EQ(0, p.get("lost").number);
    EXPECT_EQ("FAAB-2525", p.get("fwCode").text);
    EXPECT_FALSE(p.has("nested"));
}

TEST_F(CloudApiClientTest, RenewsSessionAfterTwoHours) {
    client->readRuntime("1234567890");
    now += CLOUD_SESSION_LIFETIME_S;
    client->readRuntime("1234567890");
    EXPECT_EQ(2, logins);
    EXPECT_EQ("JSESSIONID=SESSION2", http->requests.back().headers["Cookie"]);
}

TEST_F(CloudApiClientTest, RejectedLoginIsAuthError) {
    http->handler = [](const RecordedRequest&) {
        return jsonResponse(200, "{\"success\":false,\"message\":\"LOGIN_ERROR_BAD_PASSWORD\"}");
    };
    EXPECT_THROW(client->connect(), AuthException);
    EXPECT_FALSE(client->hasSession());
}

TEST_F(CloudApiClientTest, LoginWithoutCookieIsAuthError) {
    http->handler = [](const RecordedRequest&) { return jsonResponse(200, "{\"success\":true}"); };
    EXPECT_THROW(client->connect(), AuthException);
}

TEST_F(CloudApiClientTest, MissingCredentialsIsAuthError) {
    CloudApiClient anonymous(CloudCredentials(), http);
    EXPECT_THROW(anonymous.readRuntime("1234567890"), AuthException);
    EXPECT_TRUE(http->requests.empty());
}

TEST_F(CloudApiClientTest, Http401ClearsSession) {
    client->connect();
    runtime_reply = jsonResponse(401, "");
    EXPECT_THROW(client->readRuntime("1234567890"), AuthException);
    EXPECT_FALSE(client->hasSession());
}

TEST_F(CloudApiClientTest, ServerErrorIsConnectionError) {
    runtime_reply = jsonResponse(503, "busy");
    EXPECT_THROW(client->readRuntime("1234567890"), ConnectionException);
    runtime_reply = jsonResponse(-1, "");
    EXPECT_THROW(client->readRuntime("1234567890"), ConnectionException);
}

TEST_F(CloudApiClientTest, UnparsableBodyIsDecodingError) {
    runtime_reply = jsonResponse(200, "<html>maintenance</html>");
    EXPECT_THROW(client->readRuntime("1234567890"), DecodingException);
}

TEST_F(CloudApiClientTest, ApiFailureMapping) {
    runtime_reply = jsonResponse(200, "{\"success\":false,\"message\":\"DEVICE_ERROR_UNSUPPORT_DEVICE_TYPE\"}");
    EXPECT_THROW(client->readRuntime("1234567890"), UnsupportedException);

    runtime_reply = jsonResponse(200, "{\"success\":false,\"message\":\"please login again\"}");
    EXPECT_THROW(client->readRuntime("1234567890"), AuthException);
    EXPECT_FALSE(client->hasSession());

    runtime_reply = jsonResponse(200, "{\"success\":false,\"message\":\"DATAFRAME_TIMEOUT\"}");
    EXPECT_THROW(client->readRuntime("1234567890"), ApiException);
}

TEST_F(CloudApiClientTest, ReadsBatteryModules) {
    http->handler = [this](const RecordedRequest& req) {
        if (endsWith(req.url, "/WManage/api/login")) return loginResponse("S" + std::to_string(++logins));
        return jsonResponse(200,
            "{\"success\":true,\"soc\":76,\"totalNumber\":2,\"batteryArray\":["
            "{\"batteryKey\":\"1234567890_Battery_ID_01\",\"soc\":75,\"totalVoltage\":5312},"
            "{\"batteryKey\":\"1234567890_Battery_ID_02\",\"soc\":77}]}");
    };
    BatteryReading r = client->readBattery("1234567890");
    EXPECT_DOUBLE_EQ(76, r.bank.get("soc").number);
    ASSERT_EQ(2u, r.modules.size());
    EXPECT_EQ("1234567890_Battery_ID_01", r.modules[0].battery_key);
    EXPECT_DOUBLE_EQ(5312, r.modules[0].payload.get("totalVoltage").number);
    EXPECT_FALSE(r.bank.has("batteryArray"));
}

TEST_F(CloudApiClientTest, ReadsMidboxData) {
    http->handler = [this](const RecordedRequest& req) {
        if (endsWith(req.url, "/WManage/api/login")) return loginResponse("S" + std::to_string(++logins));
        return jsonResponse(200,
            "{\"success\":true,\"fwCode\":\"IAAB-1300\",\"midboxData\":{\"gridFreq\":5998,\"smartPort1Status\":1}}");
    };
    RawPayload p = client->readMidbox("9876543210");
    EXPECT_EQ(PayloadKind::MIDBOX, p.kind);
    EXPECT_DOUBLE_EQ(5998, p.get("gridFreq").number);
    EXPECT_EQ("IAAB-1300", p.get("fwCode").text);

    http->handler = [](const RecordedRequest&) { return jsonResponse(200, "{\"success\":true}"); };
    EXPECT_THROW(client->readMidbox("9876543210"), DecodingException);
}

TEST_F(CloudApiClientTest, IdentificationFromRuntime) {
    EXPECT_EQ(2092, client->readDeviceType("1234567890"));
    EXPECT_EQ("FAAB-2525", client->readFirmwareVersion("1234567890"));
    EXPECT_THROW(client->readParallelConfig("1234567890"), UnsupportedException);
}

TEST_F(CloudApiClientTest, DisconnectDropsSession) {
    client->connect();
    EXPECT_TRUE(client->hasSession());
    client->disconnect();
    EXPECT_FALSE(client->hasSession());
    client->readRuntime("1234567890");
    EXPECT_EQ(2, logins);
}

TEST(HttpResponseTest, ExtractsCookieValue) {
    HttpResponse r;
    r.headers["Set-Cookie"] = "lang=en; Path=/, JSESSIONID=ABC123; Path=/WManage; HttpOnly";
    EXPECT_EQ("ABC123", r.cookie("JSESSIONID"));
    EXPECT_EQ("en", r.cookie("lang"));
    EXPECT_EQ("", r.cookie("missing"));
}
