#include <gtest/gtest.h>

#include "LanChat/transport.hpp"
#include "LanChat/wire.hpp"

namespace {

TransportErrorCause decodeFailure(const std::string& payload) {
    try {
        decodeFrame(payload);
    } catch (const TransportError& e) {
        return e.cause();
    }
    ADD_FAILURE() << "decoded: " << payload;
    return TransportErrorCause::Io;
}

}

TEST(WireTest, Base64KnownVectors) {
    EXPECT_EQ(base64Encode(""), "");
    EXPECT_EQ(base64Encode("f"), "Zg==");
    EXPECT_EQ(base64Encode("fo"), "Zm8=");
    EXPECT_EQ(base64Encode("foobar"), "Zm9vYmFy");

    std::string out;
    EXPECT_TRUE(base64Decode("Zm9vYmE=", out));
    EXPECT_EQ(out, "fooba");
}

TEST(WireTest, Base64RejectsMisplacedPadding) {
    std::string out;
    EXPECT_FALSE(base64Decode("Zg==Zm8=", out));
    EXPECT_FALSE(base64Decode("Z=g=", out));
    EXPECT_FALSE(base64Decode("Zm9", out));
    EXPECT_FALSE(base64Decode("Zm9v!mFy", out));
}

TEST(WireTest, IdentityFrame) {
    const std::string payload = encodeIdentity(Participant("Zoë|x", "10.0.0.9", true, "me.png"));
    EXPECT_EQ(payload.rfind("LC1|ID|", 0), 0u);

    const Frame frame = decodeFrame(payload);
    const auto* identity = std::get_if<IdentityFrame>(&frame);
    ASSERT_NE(identity, nullptr);
    EXPECT_EQ(identity->participant.name(), "Zoë|x");
    EXPECT_EQ(identity->participant.address(), "10.0.0.9");
    EXPECT_TRUE(identity->participant.online());
    EXPECT_EQ(identity->participant.avatar(), "me.png");
}

TEST(WireTest, CommandEventKeepsArgumentsAndTimestamp) {
    const auto when = ChatEvent::Clock::time_point(std::chrono::milliseconds(1700000000123LL));
    const ChatEvent event(Participant("Ann", "10.0.0.1"), Command{"topic", {"lunch | now", ""}}, when);

    const Frame frame = decodeFrame(encodeEvent(event, Route::Relayed));
    const auto* decoded = std::get_if<EventFrame>(&frame);
    ASSERT_NE(decoded, nullptr);
    EXPECT_EQ(decoded->route, Route::Relayed);
    EXPECT_EQ(decoded->event.sender(), event.sender());
    EXPECT_EQ(decoded->event.timestamp(), when);

    const auto* command = std::get_if<Command>(&decoded->event.payload());
    ASSERT_NE(command, nullptr);
    EXPECT_EQ(command->name, "topic");
    EXPECT_EQ(command->args, (std::vector<std::string>{"lunch | now", ""}));
}

TEST(WireTest, FileShareCarriesSize) {
    const ChatEvent event(Participant("Ann", "10.0.0.1"), FileShare{"big.iso", 4700000000ULL});

    const Frame frame = decodeFrame(encodeEvent(event, Route::Direct));
    const auto& decoded = std::get<EventFrame>(frame);
    const auto& file = std::get<FileShare>(decoded.event.payload());
    EXPECT_EQ(file.fileName, "big.iso");
    EXPECT_EQ(file.sizeBytes, 4700000000ULL);
}

TEST(WireTest, EmptyChatTextSurvives) {
    const Frame frame = decodeFrame(encodeEvent(ChatEvent(Participant("Ann", "10.0.0.1"), ChatText{""}),
                                                Route::Broadcast));
    EXPECT_EQ(std::get<EventFrame>(frame).event.body(), "");
}

TEST(WireTest, MalformedFramesAreProtocolErrors) {
    EXPECT_EQ(decodeFailure(""), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("CT2|ID|QQ==|MQ==|1|YQ=="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|ID|QQ==|MQ==|2|YQ=="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|ID||MQ==|1|YQ=="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|XX|QQ=="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|EV|Q|CHAT|0|QQ==|MQ==|aGk="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|EV|D|SHOUT|0|QQ==|MQ==|aGk="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|EV|D|CHAT|-5|QQ==|MQ==|aGk="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|EV|D|CHAT|99999999999999999999|QQ==|MQ==|aGk="), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|EV|D|CHAT|0|QQ==|MQ==|aGk=|extra"), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|EV|D|COMMAND|0|QQ==|MQ==|aGk=|2|YQ=="), TransportErrorCause::Protocol);
}

TEST(WireTest, TimestampBeyondTheClockRangeIsRejected) {
    const std::string tail = "|QQ==|MQ==|aGk=";
    const std::string latest = std::to_string(MAX_EPOCH_MILLIS);
    const std::string tooLate = std::to_string(static_cast<unsigned long long>(MAX_EPOCH_MILLIS) + 1);

    const Frame frame = decodeFrame("LC1|EV|B|CHAT|" + latest + tail);
    const auto sinceEpoch = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::get<EventFrame>(frame).event.timestamp().time_since_epoch());
    EXPECT_EQ(sinceEpoch.count(), MAX_EPOCH_MILLIS);

    EXPECT_EQ(decodeFailure("LC1|EV|B|CHAT|" + tooLate + tail), TransportErrorCause::Protocol);
    EXPECT_EQ(decodeFailure("LC1|EV|B|CHAT|32503680000000000" + tail), TransportErrorCause::Protocol);
}
