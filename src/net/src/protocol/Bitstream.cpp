// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.cpp
/// @brief Bitstream implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <ltr/net/protocol/Bitstream.hpp>
#include <ltr/core/Assert.hpp>

#include <format>

namespace ltr::net::protocol {

Bitstream::Bitstream() noexcept = default;

Bitstream::Bitstream(std::span<const core::byte> data)
    : buffer_{data.begin(), data.end()}
    , writeBit_{static_cast<core::u32>(data.size() * 8)}
    , readBit_{0}
    , totalBits_{static_cast<core::u32>(data.size() * 8)}
    , readOnly_{true}
{}

Bitstream::~Bitstream() = default;

// -------------------------------------------------------------------------- //
//  Write                                                                     //
// -------------------------------------------------------------------------- //

void Bitstream::writeBits(core::u32 value, core::u32 bitCount)
{
    LTR_ASSERT(!readOnly_);
    LTR_ASSERT(bitCount > 0 && bitCount <= 32);

    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::u32 byteIdx = writeBit_ >> 3;
        const core::u32 bitIdx  = writeBit_ & 7;

        if (byteIdx >= static_cast<core::u32>(buffer_.size()))
        {
            buffer_.push_back(core::byte{0});
        }

        const core::u32 bit = (value >> (bitCount - 1 - i)) & 1u;
        auto& b = buffer_[byteIdx];
        b = static_cast<core::byte>(
            (static_cast<core::u8>(b) & ~(1u << (7 - bitIdx))) |
            (bit << (7 - bitIdx)));

        ++writeBit_;
    }

    totalBits_ = writeBit_;
}

void Bitstream::writeU8(core::u8 value)   { writeBits(value, 8); }
void Bitstream::writeU16(core::u16 value) { writeBits(value, 16); }
void Bitstream::writeU32(core::u32 value) { writeBits(value, 32); }

core::Expected<void> Bitstream::writeString(std::string_view text)
{
    if (text.size() > 0xFF)
    {
        return core::makeError(core::ErrorCode::kSerializationFailed,
                               std::format("string of {} bytes exceeds 255", text.size()));
    }

    writeU8(static_cast<core::u8>(text.size()));
    for (const char c : text)
    {
        writeU8(static_cast<core::u8>(c));
    }
    return {};
}

// -------------------------------------------------------------------------- //
//  Read                                                                      //
// -------------------------------------------------------------------------- //

core::Expected<core::u32> Bitstream::readBits(core::u32 bitCount)
{
    LTR_ASSERT(bitCount > 0 && bitCount <= 32);

    if (readBit_ + bitCount > totalBits_)
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed, "Bitstream underflow");
    }

    core::u32 result = 0;
    for (core::u32 i = 0; i < bitCount; ++i)
    {
        const core::u32 byteIdx = readBit_ >> 3;
        const core::u32 bitIdx  = readBit_ & 7;
        const core::u32 bit = (static_cast<core::u8>(buffer_[byteIdx]) >> (7 - bitIdx)) & 1u;
        result = (result << 1) | bit;
        ++readBit_;
    }

    return result;
}

core::Expected<core::u8> Bitstream::readU8()
{
    auto bits = readBits(8);
    if (!bits.has_value()) return core::makeError(bits.error().code(), bits.error().message());
    return static_cast<core::u8>(bits.value());
}

core::Expected<core::u16> Bitstream::readU16()
{
    auto bits = readBits(16);
    if (!bits.has_value()) return core::makeError(bits.error().code(), bits.error().message());
    return static_cast<core::u16>(bits.value());
}

core::Expected<core::u32> Bitstream::readU32()
{
    return readBits(32);
}

core::Expected<std::string> Bitstream::readString()
{
    const auto length = LTR_TRY(readU8());
    if (static_cast<core::u32>(length) * 8 > bitsRemaining())
    {
        return core::makeError(core::ErrorCode::kDeserializationFailed,
                               std::format("string of {} bytes runs past the datagram", length));
    }

    std::string out(length, '\0');
    for (auto& c : out)
    {
        c = static_cast<char>(LTR_TRY(readU8()));
    }
    return out;
}

// -------------------------------------------------------------------------- //
//  Query                                                                     //
// -------------------------------------------------------------------------- //

core::u32 Bitstream::bitsRemaining() const noexcept
{
    return (totalBits_ > readBit_) ? totalBits_ - readBit_ : 0;
}

std::span<const core::byte> Bitstream::data() const noexcept { return buffer_; }

} // namespace ltr::net::protocol
