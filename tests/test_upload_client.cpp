// tests/test_upload_client.cpp
#include "upload_client.hpp"
#include "stub_collector.hpp"
#include <gtest/gtest.h>
#include <cstdlib>

using namespace std::chrono_literals;

class HttpUploadClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        // keep loopback traffic away from any proxy configured in the environment
        setenv("no_proxy", "127.0.0.1,localhost", 1);
        setenv("NO_PROXY", "127.0.0.1,localhost", 1);
    }
};

TEST(UploadClassification, OkWith2xxIsSuccess) {
    EXPECT_EQ(HttpUploadClient::classify(CURLE_OK, 200, "").status, UploadStatus::Success);
    EXPECT_EQ(HttpUploadClient::classify(CURLE_OK, 204, "").status, UploadStatus::Success);
}

TEST(UploadClassification, OtherStatusCarriesCode) {
    auto result = HttpUploadClient::classify(CURLE_OK, 500, "");
    EXPECT_EQ(result.status, UploadStatus::HttpError);
    EXPECT_EQ(result.http_code, 500);
    EXPECT_EQ(result.describe(), "HTTP 500");

    EXPECT_EQ(HttpUploadClient::classify(CURLE_OK, 301, "").status, UploadStatus::HttpError);
    EXPECT_EQ(HttpUploadClient::classify(CURLE_OK, 404, "").http_code, 404);
}

TEST(UploadClassification, TransportFailures) {
    EXPECT_EQ(HttpUploadClient::classify(CURLE_OPERATION_TIMEDOUT, 0, "").status, UploadStatus::Timeout);
    EXPECT_EQ(HttpUploadClient::classify(CURLE_COULDNT_CONNECT, 0, "").status, UploadStatus::ConnectionFailed);
    EXPECT_EQ(HttpUploadClient::classify(CURLE_COULDNT_RESOLVE_HOST, 0, "").status, UploadStatus::ConnectionFailed);
    EXPECT_EQ(HttpUploadClient::classify(CURLE_OPERATION_TIMEDOUT, 0, "").describe(), "Timeout");
    EXPECT_EQ(HttpUploadClient::classify(CURLE_COULDNT_CONNECT, 0, "").describe(), "Connection failed");
}

TEST(UploadClassification, UnclassifiedErrorDetailIsTruncated) {
    std::string long_text(120, 'x');
    auto result = HttpUploadClient::classify(CURLE_SSL_CONNECT_ERROR, 0, long_text);
    EXPECT_EQ(result.status, UploadStatus::Error);
    EXPECT_EQ(result.detail.size(), HttpUploadClient::MAX_DETAIL_LENGTH);
    EXPECT_EQ(result.describe(), "Error: " + std::string(50, 'x'));

    auto fallback = HttpUploadClient::classify(CURLE_SSL_CONNECT_ERROR, 0, "");
    EXPECT_FALSE(fallback.detail.empty());
    EXPECT_LE(fallback.detail.size(), HttpUploadClient::MAX_DETAIL_LENGTH);
}

TEST(UploadClassification, ConnectionFailureDetailIsTruncated) {
    std::string long_text(120, 'x');
    auto result = HttpUploadClient::classify(CURLE_COULDNT_CONNECT, 0, long_text);
    EXPECT_EQ(result.status, UploadStatus::ConnectionFailed);
    EXPECT_EQ(result.detail, std::string(50, 'x'));
    EXPECT_EQ(result.describe(), "Connection failed");
}

TEST(UploadClassification, EmptyUrlRejected) {
    EXPECT_THROW(HttpUploadClient("", 5000ms), std::runtime_error);
}

TEST_F(HttpUploadClientTest, Status200IsSuccess) {
    StubCollector collector(200);
    HttpUploadClient client(collector.url(), 5000ms);

    UploadResult result = client.post(R"({"device_id":"powermon_test"})");
    EXPECT_TRUE(result.ok());
    EXPECT_EQ(result.describe(), "Success");
    EXPECT_EQ(collector.get_requests(), 1u);
    EXPECT_EQ(collector.get_last_body(), R"({"device_id":"powermon_test"})");
    EXPECT_NE(collector.get_last_request().find("POST /api/data"), std::string::npos);
    EXPECT_NE(collector.get_last_request().find("application/json"), std::string::npos);
}

TEST_F(HttpUploadClientTest, Status500IsFailureWithCode) {
    StubCollector collector(500);
    HttpUploadClient client(collector.url(), 5000ms);

    UploadResult result = client.post("{}");
    EXPECT_FALSE(result.ok());
    EXPECT_EQ(result.status, UploadStatus::HttpError);
    EXPECT_EQ(result.http_code, 500);
    EXPECT_EQ(client.get_last_response(), "{}");
}

TEST_F(HttpUploadClientTest, SlowCollectorTimesOut) {
    StubCollector collector(200);
    collector.set_delay(2000ms);
    HttpUploadClient client(collector.url(), 300ms);

    auto start = std::chrono::steady_clock::now();
    UploadResult result = client.post("{}");
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(result.status, UploadStatus::Timeout);
    EXPECT_LT(elapsed, 1500ms);
}

TEST_F(HttpUploadClientTest, RefusedConnectionIsConnectionFailure) {
    HttpUploadClient client("http://127.0.0.1:" + std::to_string(unused_local_port()) + "/api/data", 2000ms);

    UploadResult result = client.post("{}");
    EXPECT_EQ(result.status, UploadStatus::ConnectionFailed);
}
