// tests/message_test.cpp
// Message validation, expansion, and the Aps payload builder.

#include <gtest/gtest.h>
#include "apns/aps.hpp"
#include "apns/error.hpp"
#include "apns/message.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

using namespace apns;

namespace {

const std::string TOKEN_A = "1ba97ad1311307c189696e2369c89fa83d652611a6e3c7370881289e45668fd3";
const std::string TOKEN_B = "00000000000000000000000000000000000000000000000000000000000000ff";

ErrorKind kind_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const ApnsError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected ApnsError";
    return ErrorKind::Io;
}

} // namespace

// ==================== Aps ====================

TEST(ApsTest, Empty) {
    EXPECT_EQ(Aps().to_json(), R"({"aps":{}})");
}

TEST(ApsTest, StandardFields) {
    auto json = Aps().alert("Hello").badge(3).sound("default").to_json();
    EXPECT_EQ(json, R"({"aps":{"alert":"Hello","badge":3,"sound":"default"}})");
}

TEST(ApsTest, AlertWithTitle) {
    auto json = Aps().alert("Title", "Body").to_json();
    EXPECT_EQ(json, R"({"aps":{"alert":{"title":"Title","body":"Body"}}})");
}

TEST(ApsTest, ContentAvailableAndCategory) {
    auto json = Aps().content_available().category("NEWS").to_json();
    EXPECT_EQ(json, R"({"aps":{"content-available":1,"category":"NEWS"}})");
}

TEST(ApsTest, ContentAvailableCanBeCleared) {
    EXPECT_EQ(Aps().content_available().content_available(false).to_json(), R"({"aps":{}})");
}

TEST(ApsTest, Extras) {
    auto json = Aps().badge(1).extra("conversation", "c-42").extra("unread", 7).to_json();
    EXPECT_EQ(json, R"({"aps":{"badge":1},"conversation":"c-42","unread":7})");
}

TEST(ApsTest, EscapesStrings) {
    auto json = Aps().alert("say \"hi\"\n\\").extra("ctl", std::string("\x01", 1)).to_json();
    EXPECT_EQ(json, R"({"aps":{"alert":"say \"hi\"\n\\"},"ctl":"\u0001"})");
}

TEST(ApsTest, Utf8PassesThrough) {
    auto json = Aps().alert("caf\xc3\xa9").to_json();
    EXPECT_EQ(json, "{\"aps\":{\"alert\":\"caf\xc3\xa9\"}}");
}

TEST(ApsTest, Bytes) {
    auto aps = Aps().badge(1);
    auto json = aps.to_json();
    EXPECT_EQ(aps.to_json_bytes(), std::vector<uint8_t>(json.begin(), json.end()));
}

// ==================== Message ====================

TEST(MessageTest, ExpandsOnePerToken) {
    Message message({TOKEN_A, TOKEN_B}, R"({"aps":{"badge":1}})");
    ASSERT_EQ(message.size(), 2u);

    auto notifications = message.notifications(100);
    ASSERT_EQ(notifications.size(), 2u);
    EXPECT_EQ(notifications[0].identifier, 100u);
    EXPECT_EQ(notifications[1].identifier, 101u);
    EXPECT_EQ(notifications[0].token_hex(), TOKEN_A);
    EXPECT_EQ(notifications[1].token_hex(), TOKEN_B);
    EXPECT_EQ(notifications[0].payload, notifications[1].payload);
    EXPECT_EQ(notifications[0].priority, Priority::Immediate);
    EXPECT_EQ(notifications[0].expiration, 0u);
}

TEST(MessageTest, IdentifiersWrap) {
    Message message({TOKEN_A, TOKEN_A, TOKEN_A}, "{}");
    auto notifications = message.notifications(0xFFFFFFFF);
    EXPECT_EQ(notifications[0].identifier, 0xFFFFFFFFu);
    EXPECT_EQ(notifications[1].identifier, 0u);
    EXPECT_EQ(notifications[2].identifier, 1u);
}

TEST(MessageTest, FromAps) {
    Message message({TOKEN_A}, Aps().alert("hi"), std::nullopt, Priority::ConservePower);
    EXPECT_EQ(message.payload(), R"({"aps":{"alert":"hi"}})");
    EXPECT_EQ(message.priority(), Priority::ConservePower);
}

TEST(MessageTest, ExpirationEncodesEpochSeconds) {
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(1420070400));
    Message message({TOKEN_A}, "{}", when);
    EXPECT_EQ(message.expiration(), 1420070400u);
    EXPECT_EQ(message.notifications(1)[0].expiration, 1420070400u);
}

TEST(MessageTest, ExpirationBeforeEpochRejected) {
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(-5));
    EXPECT_EQ(kind_of([&] { Message({TOKEN_A}, "{}", when); }), ErrorKind::Validation);
}

TEST(MessageTest, ExpirationBeyond32BitsRejected) {
    auto when = std::chrono::system_clock::time_point(std::chrono::seconds(int64_t(1) << 33));
    EXPECT_EQ(kind_of([&] { Message({TOKEN_A}, "{}", when); }), ErrorKind::Validation);
}

TEST(MessageTest, NoTokensRejected) {
    try {
        Message(std::vector<std::string>{}, "{}");
        FAIL() << "expected ApnsError";
    } catch (const ApnsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        EXPECT_EQ(e.field(), "tokens");
    }
}

TEST(MessageTest, BadHexTokenRejected) {
    try {
        Message({TOKEN_A, "not-hex"}, "{}");
        FAIL() << "expected ApnsError";
    } catch (const ApnsError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Validation);
        EXPECT_EQ(e.field(), "token");
    }
}

TEST(MessageTest, PayloadLimits) {
    EXPECT_NO_THROW(Message({TOKEN_A}, std::string(2048, 'x')));
    EXPECT_EQ(kind_of([&] { Message({TOKEN_A}, std::string(2049, 'x')); }), ErrorKind::Validation);
    EXPECT_EQ(kind_of([&] { Message({TOKEN_A}, std::string()); }), ErrorKind::Validation);
}

TEST(MessageTest, BadPriorityRejected) {
    EXPECT_EQ(kind_of([&] { Message({TOKEN_A}, "{}", std::nullopt, static_cast<Priority>(1)); }),
              ErrorKind::Validation);
}
