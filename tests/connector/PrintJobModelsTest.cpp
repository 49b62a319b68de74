#include "connector/models/print-job/PrintJobRequest.hpp"
#include "connector/models/print-job/PrintJobResponse.hpp"

#include <gtest/gtest.h>

using namespace connector::models::print_job;

TEST(PrintJobRequestTest, ParsesToleratingMissingAndMistypedFields) {
    PrintJobRequest request(nlohmann::json::parse(R"({
        "requestId": "r-1", "hubId": "hub", "printerId": "bar", "payload": "Hello", "timeoutMs": "soon"
    })"));

    EXPECT_EQ(request.requestId, "r-1");
    EXPECT_EQ(request.encoding, "text");
    EXPECT_EQ(request.timeoutMs, 0);
    EXPECT_TRUE(request.isValid());
    EXPECT_FALSE(request.isBroadcast());
}

TEST(PrintJobRequestTest, ReportsFirstValidationProblem) {
    PrintJobRequest request;
    EXPECT_EQ(request.validationError(), "requestId is required");

    request.requestId = "r";
    request.hubId = "hub";
    request.printerId = "*";
    EXPECT_EQ(request.validationError(), "payload is empty");
    EXPECT_TRUE(request.isBroadcast());

    request.payload = "abc";
    request.encoding = "base64";
    EXPECT_EQ(request.validationError(), "unsupported encoding: base64");

    request.encoding = "hex";
    EXPECT_EQ(request.validationError(), "hex payload has odd length");

    request.payload = "zz";
    EXPECT_EQ(request.validationError(), "hex payload has non-hex characters");

    request.payload = "1b40";
    request.timeoutMs = -1;
    EXPECT_EQ(request.validationError(), "timeoutMs must be >= 0");
}

TEST(PrintJobRequestTest, DecodesHexPayload) {
    PrintJobRequest request;
    request.encoding = "hex";
    request.payload = "1B400A";

    core::types::Payload expected{0x1b, 0x40, 0x0a};
    EXPECT_EQ(request.decodePayload(), expected);

    request.payload = "1B4";
    EXPECT_THROW(request.decodePayload(), std::invalid_argument);
}

TEST(PrintJobResponseTest, ErrorFieldOnlyPresentOnFailure) {
    PrintJobResponse response;
    response.hubId = "hub";
    response.requestId = "r-1";
    response.ok = true;
    response.results.push_back({"bar", true, "SUCCESS", "Transmitted 5 bytes"});

    auto json = response.toJson();
    EXPECT_FALSE(json.contains("error"));
    ASSERT_EQ(json["results"].size(), 1u);
    EXPECT_EQ(json["results"][0]["code"], "SUCCESS");

    response.ok = false;
    response.error = "NO_CONNECTED_PRINTERS";
    response.results.clear();
    PrintJobResponse parsed(response.toJson());
    EXPECT_EQ(parsed.error, "NO_CONNECTED_PRINTERS");
    EXPECT_FALSE(parsed.ok);
    EXPECT_TRUE(parsed.results.empty());
    EXPECT_TRUE(parsed.isValid());
}
