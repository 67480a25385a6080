#include "rangexfer/capability_prober.hpp"
#include "rangexfer/errors.hpp"

#include "fake_http_client.hpp"

#include <gtest/gtest.h>

namespace rangexfer {
namespace {

using test::FakeHttpClient;
using test::makeContent;

constexpr const char* kUrl = "http://files.test/download?file=a.bin";

TEST(CapabilityProberTest, HeadSizeAndRangeSupport) {
    FakeHttpClient client(makeContent(5000));

    const auto result = CapabilityProber(client).probe(kUrl);

    EXPECT_EQ(result.capability, Capability::SizeKnownRangeable);
    EXPECT_EQ(result.total_size, 5000);
    EXPECT_EQ(client.bytesServed(), 0);
}

TEST(CapabilityProberTest, FallsBackToStreamingProbeWithoutHead) {
    FakeHttpClient::Options options;
    options.support_head = false;
    FakeHttpClient client(makeContent(5000), options);

    const auto result = CapabilityProber(client).probe(kUrl);

    EXPECT_EQ(result.capability, Capability::SizeKnownRangeable);
    EXPECT_EQ(result.total_size, 5000);
    EXPECT_EQ(client.bytesServed(), 0) << "the streaming probe must stop at the headers";
}

TEST(CapabilityProberTest, FullBodyOnRangeProbeMeansNotRangeable) {
    FakeHttpClient::Options options;
    options.honor_ranges = false;
    FakeHttpClient client(makeContent(5000), options);

    const auto result = CapabilityProber(client).probe(kUrl);

    EXPECT_EQ(result.capability, Capability::SizeKnownNotRangeable);
    EXPECT_EQ(result.total_size, 5000);
    EXPECT_EQ(client.bytesServed(), 0);
}

TEST(CapabilityProberTest, NoContentLengthMeansSizeUnknown) {
    FakeHttpClient::Options options;
    options.support_head = false;
    options.send_content_length = false;
    FakeHttpClient client(makeContent(5000), options);

    const auto result = CapabilityProber(client).probe(kUrl);

    EXPECT_EQ(result.capability, Capability::SizeUnknown);
    EXPECT_EQ(result.total_size, -1);
}

TEST(CapabilityProberTest, TransportErrorIsProbeFailure) {
    FakeHttpClient::Options options;
    options.unreachable = true;
    FakeHttpClient client(makeContent(10), options);

    try {
        (void)CapabilityProber(client).probe(kUrl);
        FAIL() << "probe should have thrown";
    } catch (const TransferError& ex) {
        EXPECT_EQ(ex.kind(), ErrorKind::ProbeFailed);
    }
}

TEST(CapabilityProberTest, ParseContentLength) {
    HttpResponse response;
    EXPECT_EQ(parseContentLength(response), -1);

    response.headers["content-length"] = "1000000";
    EXPECT_EQ(parseContentLength(response), 1000000);

    response.headers["content-length"] = "0";
    EXPECT_EQ(parseContentLength(response), -1);

    response.headers["content-length"] = "-1";
    EXPECT_EQ(parseContentLength(response), -1);

    response.headers["content-length"] = "12ab";
    EXPECT_EQ(parseContentLength(response), -1);

    response.headers["content-length"] = "99999999999999999999999";
    EXPECT_EQ(parseContentLength(response), -1);
}

} // namespace
} // namespace rangexfer
