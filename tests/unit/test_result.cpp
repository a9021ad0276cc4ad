#include <gtest/gtest.h>
#include <agentdispatch/agentdispatch.hpp>

using namespace agentdispatch;

TEST(ResultTest, SuccessHoldsValue) {
    auto r = Result<int>::success(42);
    EXPECT_TRUE(r.ok());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
    EXPECT_THROW(r.error(), std::logic_error);
}

TEST(ResultTest, FailureHoldsKindAndMessage) {
    auto r = Result<std::string>::failure(ErrorKind::NoSuitableAgent, "pool empty");
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.kind(), ErrorKind::NoSuitableAgent);
    EXPECT_EQ(r.message(), "pool empty");
    EXPECT_THROW(r.value(), std::logic_error);
}

TEST(ResultTest, FailureFromErrorValue) {
    Error e{ErrorKind::Synthesis, "join failed"};
    auto r = Result<int>::failure(e);
    EXPECT_EQ(r.kind(), ErrorKind::Synthesis);
    EXPECT_EQ(r.message(), "join failed");
}

TEST(ResultTest, ValueIsMutable) {
    auto r = Result<std::vector<int>>::success({1, 2});
    r.value().push_back(3);
    EXPECT_EQ(r.value().size(), 3u);
}

TEST(ResultTest, ErrorKindNames) {
    EXPECT_STREQ(to_string(ErrorKind::Validation), "Validation");
    EXPECT_STREQ(to_string(ErrorKind::Collaborator), "Collaborator");
    EXPECT_STREQ(to_string(ErrorKind::TerminalFallback), "TerminalFallback");
}
