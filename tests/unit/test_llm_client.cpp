#include <gtest/gtest.h>
#include <agentdispatch/agentdispatch.hpp>

using namespace agentdispatch;

TEST(ExtractResponseContentTest, BareString) {
    EXPECT_EQ(extract_response_content(json("plain answer")), "plain answer");
}

TEST(ExtractResponseContentTest, MessageContentShape) {
    json response = {{"message", {{"role", "assistant"}, {"content", "from message"}}}};
    EXPECT_EQ(extract_response_content(response), "from message");
}

TEST(ExtractResponseContentTest, ChoicesShape) {
    json response = {
        {"choices", json::array({{{"message", {{"content", "first choice"}}}},
                                 {{"message", {{"content", "second choice"}}}}})},
    };
    EXPECT_EQ(extract_response_content(response), "first choice");
}

TEST(ExtractResponseContentTest, NullIsEmpty) {
    EXPECT_EQ(extract_response_content(json()), "");
}

TEST(ExtractResponseContentTest, UnknownShapeIsSerialized) {
    json response = {{"output", 7}};
    EXPECT_EQ(extract_response_content(response), response.dump());
}

TEST(ExtractResponseContentTest, EmptyChoicesIsSerialized) {
    json response = {{"choices", json::array()}};
    EXPECT_EQ(extract_response_content(response), response.dump());
}

TEST(ExtractResponseContentTest, InvalidUtf8InUnknownShapeIsReplaced) {
    json response = {{"output", std::string("\xff")}};
    std::string text;
    EXPECT_NO_THROW(text = extract_response_content(response));
    EXPECT_NE(text.find("\xef\xbf\xbd"), std::string::npos);
}
