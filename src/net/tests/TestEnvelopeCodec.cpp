/**
 * @file TestEnvelopeCodec.cpp
 * @brief Unit tests for net::protocol::EnvelopeCodec and Bitstream.
 */

#include <catch2/catch.hpp>

#include "ltr/net/protocol/Bitstream.hpp"
#include "ltr/net/protocol/Envelope.hpp"
#include "ltr/net/protocol/Protocol.hpp"

#include <string>

namespace ltr::net::protocol {

namespace {

Envelope leaderUpdate()
{
    Envelope env;
    env.isLeader = true;
    env.sender = {"p1", "10.0.0.1:7001", {3, 1}, grid::Direction::Right, 0};
    env.deadNodes.insert("p4");
    env.deadNodes.insert("p6");
    env.history["p1"] = {{1, 1}, {2, 1}, {3, 1}};
    env.history["p2"] = {{8, 8}, {7, 8}, {7, 8}};
    env.history["p3"] = {};
    return env;
}

} // namespace

TEST_CASE("Envelope round-trips field for field", "[net][codec]")
{
    SECTION("leader state update")
    {
        const auto original = leaderUpdate();
        const auto bytes = EnvelopeCodec::encode(original);
        REQUIRE(bytes.has_value());

        const auto decoded = EnvelopeCodec::decode(*bytes);
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == original);
    }

    SECTION("direction change")
    {
        Envelope original;
        original.isDirectionChange = true;
        original.sender = {"p2", "peer-two:7002", {7, 8}, grid::Direction::Up, 0};

        const auto decoded = EnvelopeCodec::decode(EnvelopeCodec::encode(original).value());
        REQUIRE(decoded.has_value());
        REQUIRE(*decoded == original);
        REQUIRE(decoded->deadNodes.empty());
        REQUIRE(decoded->history.empty());
        REQUIRE_FALSE(decoded->isLeader);
    }

    SECTION("death report")
    {
        Envelope original;
        original.isDeathReport = true;
        original.sender = {"p3", "10.0.0.3:7003", {2, 1}, grid::Direction::Left, 0};

        const auto decoded = EnvelopeCodec::decode(EnvelopeCodec::encode(original).value());
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->isDeathReport);
        REQUIRE(decoded->sender == original.sender);
    }
}

TEST_CASE("Board slot is not carried on the wire", "[net][codec]")
{
    Envelope original;
    original.sender = {"p5", "10.0.0.5:7005", {4, 1}, grid::Direction::Right, 4};

    const auto decoded = EnvelopeCodec::decode(EnvelopeCodec::encode(original).value());
    REQUIRE(decoded.has_value());
    REQUIRE(decoded->sender.slot == 0);
    REQUIRE(decoded->sender.id == "p5");
}

TEST_CASE("Encoding refuses unrepresentable envelopes", "[net][codec]")
{
    Envelope env;
    env.sender = {"p1", "10.0.0.1:7001", {1, 1}, grid::Direction::Up, 0};

    SECTION("negative coordinate")
    {
        env.sender.position = {-1, 0};
        REQUIRE(EnvelopeCodec::encode(env).error().code() == core::ErrorCode::kSerializationFailed);
    }

    SECTION("empty identity")
    {
        env.sender.id.clear();
        REQUIRE(EnvelopeCodec::encode(env).error().code() == core::ErrorCode::kSerializationFailed);
    }

    SECTION("over-long endpoint")
    {
        env.sender.endpoint = std::string(300, 'h');
        REQUIRE(EnvelopeCodec::encode(env).error().code() == core::ErrorCode::kSerializationFailed);
    }
}

TEST_CASE("Decoding rejects malformed datagrams", "[net][codec]")
{
    const auto bytes = EnvelopeCodec::encode(leaderUpdate()).value();

    SECTION("truncated")
    {
        const std::span<const core::byte> cut{bytes.data(), bytes.size() / 2};
        REQUIRE(EnvelopeCodec::decode(cut).error().code() == core::ErrorCode::kDeserializationFailed);
    }

    SECTION("empty")
    {
        REQUIRE_FALSE(EnvelopeCodec::decode({}).has_value());
    }

    SECTION("wrong magic")
    {
        auto corrupted = bytes;
        corrupted[0] = core::byte{0x00};
        REQUIRE(EnvelopeCodec::decode(corrupted).error().code() == core::ErrorCode::kProtocolViolation);
    }

    SECTION("wrong version")
    {
        auto corrupted = bytes;
        corrupted[4] = core::byte{kProtocolVersion + 1};
        REQUIRE(EnvelopeCodec::decode(corrupted).error().code() == core::ErrorCode::kProtocolViolation);
    }
}

TEST_CASE("Bitstream packs sub-byte fields", "[net][bitstream]")
{
    Bitstream out;
    out.writeBits(0b101, 3);
    out.writeBits(1, 1);
    out.writeU16(0xBEEF);
    REQUIRE(out.writeString("trail").has_value());

    Bitstream in{out.data()};
    REQUIRE(in.readBits(3).value() == 0b101);
    REQUIRE(in.readBits(1).value() == 1);
    REQUIRE(in.readU16().value() == 0xBEEF);
    REQUIRE(in.readString().value() == "trail");
    REQUIRE_FALSE(in.readU8().has_value());
}

} // namespace ltr::net::protocol
