// /////////////////////////////////////////////////////////////////////////////
/// @file Bitstream.hpp
/// @brief Bit-level serialization stream for envelope encoding.
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <ltr/core/Types.hpp>
#include <ltr/core/Expected.hpp>
#include <ltr/core/NonCopyable.hpp>

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ltr::net::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class Bitstream
/// @brief Compact bit-level read/write stream.
///
/// Packs fields at arbitrary bit widths. All operations are deterministic
/// and endian-safe (values stored big-endian in the bit buffer). Reads past
/// the end fail with @c DeserializationFailed instead of touching memory.
// /////////////////////////////////////////////////////////////////////////////
class Bitstream final : public core::NonCopyable<Bitstream>
{
public:
    /// @brief Constructs an empty writable bitstream.
    Bitstream() noexcept;

    /// @brief Constructs a read-only bitstream over a copy of @p data.
    /// @param data   Raw bytes; every bit is readable.
    explicit Bitstream(std::span<const core::byte> data);

    ~Bitstream();

    // --------------------------------------------------------------------- //
    //  Write                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Writes @p bitCount bits from @p value.
    /// @param value    Value to write (only lower @p bitCount bits are used).
    /// @param bitCount Number of bits to write (1-32).
    void writeBits(core::u32 value, core::u32 bitCount);

    /// @brief Writes an unsigned 8-bit value.
    void writeU8(core::u8 value);

    /// @brief Writes an unsigned 16-bit value.
    void writeU16(core::u16 value);

    /// @brief Writes an unsigned 32-bit value.
    void writeU32(core::u32 value);

    /// @brief Writes a u8 length prefix followed by the characters.
    /// @return @c SerializationFailed if @p text is longer than 255 bytes.
    [[nodiscard]] core::Expected<void> writeString(std::string_view text);

    // --------------------------------------------------------------------- //
    //  Read                                                                  //
    // --------------------------------------------------------------------- //

    /// @brief Reads @p bitCount bits as an unsigned value.
    [[nodiscard]] core::Expected<core::u32> readBits(core::u32 bitCount);

    /// @brief Reads an unsigned 8-bit value.
    [[nodiscard]] core::Expected<core::u8> readU8();

    /// @brief Reads an unsigned 16-bit value.
    [[nodiscard]] core::Expected<core::u16> readU16();

    /// @brief Reads an unsigned 32-bit value.
    [[nodiscard]] core::Expected<core::u32> readU32();

    /// @brief Reads a string written by @ref writeString.
    [[nodiscard]] core::Expected<std::string> readString();

    // --------------------------------------------------------------------- //
    //  Query                                                                 //
    // --------------------------------------------------------------------- //

    /// @brief Returns the number of bits remaining for reading.
    [[nodiscard]] core::u32 bitsRemaining() const noexcept;

    /// @brief Returns the underlying byte buffer.
    [[nodiscard]] std::span<const core::byte> data() const noexcept;

private:
    std::vector<core::byte> buffer_;
    core::u32               writeBit_{0};
    core::u32               readBit_{0};
    core::u32               totalBits_{0};
    bool                    readOnly_{false};
};

} // namespace ltr::net::protocol
