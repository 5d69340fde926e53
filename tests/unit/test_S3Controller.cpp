#include <gtest/gtest.h>
#include "storage/s3/S3Controller.hpp"
#include "config/ConfigRegistry.hpp"
#include "util/curlWrappers.hpp"

using namespace sk::storage::s3;
using sk::util::HttpResponse;

namespace {

HttpResponse response(const long http, std::string body = {}, const CURLcode curl = CURLE_OK) {
    HttpResponse r;
    r.curl = curl;
    r.http = http;
    r.body = std::move(body);
    return r;
}

ControllerOptions unreachable() {
    ControllerOptions o;
    o.region = "us-east-1";
    o.endpoint = "http://127.0.0.1:1/";
    o.connect_timeout_s = 2;
    o.retries = 0;
    return o;
}

}

TEST(S3ControllerTest, OptionsFromConfig) {
    const auto o = ControllerOptions::fromConfig(sk::config::ConfigRegistry::get());
    EXPECT_EQ(o.region, "us-west-2");
    EXPECT_EQ(o.read_timeout_s, 60u);
    EXPECT_EQ(o.connect_timeout_s, 30u);
    EXPECT_EQ(o.transfer_timeout_s, 120u);
    EXPECT_EQ(o.retries, 2u);
    EXPECT_EQ(o.retry_delay_s, 1u);
    EXPECT_EQ(o.retry_backoff, 3u);
}

TEST(S3ControllerTest, RequiresCredentialsAndRegion) {
    EXPECT_THROW(S3Controller(Credentials("", "secret"), ControllerOptions{}), std::invalid_argument);
    EXPECT_THROW(S3Controller(Credentials("key", ""), ControllerOptions{}), std::invalid_argument);

    ControllerOptions noRegion;
    noRegion.region.clear();
    EXPECT_THROW(S3Controller(Credentials("key", "secret"), noRegion), std::invalid_argument);
}

TEST(S3ControllerTest, EndpointDefaultsToRegionalHost) {
    ControllerOptions o;
    o.region = "eu-central-1";
    const S3Controller ctl(Credentials("key", "secret"), o);
    EXPECT_EQ(ctl.endpoint(), "https://s3.eu-central-1.amazonaws.com");

    const S3Controller custom(Credentials("key", "secret"), unreachable());
    EXPECT_EQ(custom.endpoint(), "http://127.0.0.1:1");
}

TEST(S3ControllerTest, RetryDelayGrowsByBackoff) {
    ControllerOptions o;
    o.retry_delay_s = 4;
    o.retry_backoff = 5;
    const S3Controller ctl(Credentials("key", "secret"), o);
    EXPECT_EQ(ctl.retryDelay(0).count(), 4);
    EXPECT_EQ(ctl.retryDelay(1).count(), 20);
    EXPECT_EQ(ctl.retryDelay(2).count(), 100);
}

TEST(S3ControllerTest, ConnectionFailureIsRequestError) {
    const S3Controller ctl(Credentials("key", "secret"), unreachable());
    try {
        ctl.headObject("bucket", "key");
        FAIL() << "expected ClientError";
    } catch (const ClientError& e) {
        EXPECT_EQ(e.code(), ClientError::REQUEST_ERROR);
        EXPECT_EQ(e.httpStatus(), 0);
        EXPECT_FALSE(e.notFound());
    }
}

TEST(ClientErrorTest, NotFoundCodes) {
    EXPECT_TRUE(ClientError("404", 404, "").notFound());
    EXPECT_TRUE(ClientError("NoSuchKey", 404, "").notFound());
    EXPECT_TRUE(ClientError("NotFound", 0, "").notFound());
    EXPECT_FALSE(ClientError("AccessDenied", 403, "").notFound());
    EXPECT_FALSE(ClientError("InternalError", 500, "").notFound());
}

TEST(S3ControllerTest, RetriesConnectionFailuresThrottlingAndServerErrors) {
    EXPECT_TRUE(S3Controller::isRetryable(response(0, {}, CURLE_COULDNT_CONNECT)));
    EXPECT_TRUE(S3Controller::isRetryable(response(0, {}, CURLE_OPERATION_TIMEDOUT)));
    EXPECT_TRUE(S3Controller::isRetryable(response(429)));
    EXPECT_TRUE(S3Controller::isRetryable(response(500)));
    EXPECT_TRUE(S3Controller::isRetryable(response(503)));
}

TEST(S3ControllerTest, NeverRetriesSuccessOrOtherClientErrors) {
    EXPECT_FALSE(S3Controller::isRetryable(response(200)));
    EXPECT_FALSE(S3Controller::isRetryable(response(206)));
    EXPECT_FALSE(S3Controller::isRetryable(response(400)));
    EXPECT_FALSE(S3Controller::isRetryable(response(403)));
    EXPECT_FALSE(S3Controller::isRetryable(response(404)));
}

TEST(S3ControllerTest, BodylessNotFoundUsesStatusAsCode) {
    const auto err = S3Controller::toClientError(response(404), "HEAD", "foo", "bar/baz");
    EXPECT_EQ(err.code(), "404");
    EXPECT_EQ(err.httpStatus(), 404);
    EXPECT_TRUE(err.notFound());
}

TEST(S3ControllerTest, ErrorCodeComesFromXmlBody) {
    const auto missing = S3Controller::toClientError(
        response(404, "<?xml version=\"1.0\"?><Error><Code>NoSuchKey</Code><Message>gone</Message></Error>"),
        "GET", "foo", "bar");
    EXPECT_EQ(missing.code(), "NoSuchKey");
    EXPECT_TRUE(missing.notFound());

    const auto denied = S3Controller::toClientError(
        response(403, "<Error><Code>AccessDenied</Code></Error>"), "GET", "foo", "bar");
    EXPECT_EQ(denied.code(), "AccessDenied");
    EXPECT_EQ(denied.httpStatus(), 403);
    EXPECT_FALSE(denied.notFound());

    EXPECT_EQ(S3Controller::toClientError(response(403), "HEAD", "foo", "bar").code(), "403");
}

TEST(S3ControllerTest, ConnectionFailureMapsToRequestError) {
    const auto err = S3Controller::toClientError(response(0, {}, CURLE_COULDNT_CONNECT), "PUT", "foo", "bar");
    EXPECT_EQ(err.code(), ClientError::REQUEST_ERROR);
    EXPECT_EQ(err.httpStatus(), 0);
    EXPECT_FALSE(err.notFound());
}
