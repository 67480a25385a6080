#include "rangexfer/http_client.hpp"

#include <gtest/gtest.h>

namespace rangexfer {
namespace {

TEST(HttpClientTest, HeaderLookupIgnoresCase) {
    HttpResponse response;
    response.headers["content-length"] = "42";

    EXPECT_EQ(response.header("Content-Length").value_or(""), "42");
    EXPECT_FALSE(response.header("Content-Range").has_value());
}

TEST(HttpClientTest, SuccessfulMeansTwoHundreds) {
    HttpResponse response;
    response.status = 206;
    EXPECT_TRUE(response.successful());
    response.status = 304;
    EXPECT_FALSE(response.successful());
}

TEST(HttpClientTest, AppendQueryParameter) {
    EXPECT_EQ(appendQueryParameter("http://h/upload", "token", "abc"), "http://h/upload?token=abc");
    EXPECT_EQ(appendQueryParameter("http://h/download?file=a.bin", "token", "abc"),
              "http://h/download?file=a.bin&token=abc");
    EXPECT_EQ(appendQueryParameter("http://h/x?", "token", "abc"), "http://h/x?token=abc");
    EXPECT_EQ(appendQueryParameter("http://h/x#part", "token", "abc"), "http://h/x?token=abc#part");
}

TEST(HttpClientTest, AppendQueryParameterEncodesValue) {
    EXPECT_EQ(appendQueryParameter("http://h/x", "token", "a b&c=d/é"),
              "http://h/x?token=a%20b%26c%3Dd%2F%C3%A9");
}

TEST(HttpClientTest, RangeHeaders) {
    EXPECT_EQ(rangeHeaderValue(250000, 499999), "bytes=250000-499999");
    EXPECT_EQ(contentRangeHeaderValue(0, 1023, 4096), "bytes 0-1023/4096");
}

} // namespace
} // namespace rangexfer
