/**
 * @file BinaryIO.hpp
 * @brief Central utility functions for binary I/O.
 *
 * This file provides a single source of truth for all low-level
 * decoding logic: little-endian fixed-width integers, unsigned LEB128
 * and the modified UTF-8 used by the container's string data.
 * None of these functions throw; callers turn a failed decode into
 * the appropriate exception.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace dexview
{
namespace utils
{
    /// Longest legal encoding of a 32-bit ULEB128 value.
    constexpr size_t kMaxUleb128Length = 5;

    /**
     * @brief Reads a 16-bit little-endian unsigned short from a byte buffer.
     * @param b A pointer to at least 2 bytes of data.
     * @return The platform-native uint16_t.
     */
    inline uint16_t readLeUshort(const uint8_t* b)
    {
        return static_cast<uint16_t>(
            static_cast<uint16_t>(b[0]) |
            (static_cast<uint16_t>(b[1]) << 8)
        );
    }

    /**
     * @brief Reads a 32-bit little-endian unsigned integer from a byte buffer.
     * @param b A pointer to at least 4 bytes of data.
     * @return The platform-native uint32_t.
     */
    inline uint32_t readLeUint(const uint8_t* b)
    {
        return static_cast<uint32_t>(b[0]) |
               (static_cast<uint32_t>(b[1]) << 8) |
               (static_cast<uint32_t>(b[2]) << 16) |
               (static_cast<uint32_t>(b[3]) << 24);
    }

    /**
     * @brief Reads an unsigned little-endian integer of 1 to 8 bytes.
     * @param b A pointer to at least @p width bytes of data.
     * @param width The number of bytes to assemble.
     * @return The value, zero-extended to 64 bits.
     */
    inline uint64_t readLeUnsigned(const uint8_t* b, size_t width)
    {
        uint64_t value = 0;
        for (size_t i = 0; i < width; ++i)
        {
            value |= static_cast<uint64_t>(b[i]) << (8 * i);
        }
        return value;
    }

    /**
     * @brief Decodes one unsigned LEB128 value.
     *
     * At most five bytes are consumed, and the fifth byte may only
     * contribute the top four bits of a 32-bit value.
     *
     * @param p First byte of the encoding.
     * @param end One past the last readable byte.
     * @param value Receives the decoded value on success.
     * @return The number of bytes consumed, or 0 if the encoding runs
     * past @p end, is longer than five bytes, or overflows 32 bits.
     */
    inline size_t decodeUleb128(const uint8_t* p, const uint8_t* end, uint32_t& value)
    {
        uint32_t result = 0;
        for (size_t i = 0; i < kMaxUleb128Length; ++i)
        {
            if (p + i >= end) return 0;

            uint8_t byte = p[i];
            if (i == kMaxUleb128Length - 1 && (byte & 0xf0) != 0) return 0;

            result |= static_cast<uint32_t>(byte & 0x7f) << (7 * i);
            if ((byte & 0x80) == 0)
            {
                value = result;
                return i + 1;
            }
        }
        return 0;
    }

    /**
     * @brief Appends a Unicode code point to a UTF-8 string.
     */
    inline void appendUtf8(std::string& out, uint32_t cp)
    {
        if (cp < 0x80)
        {
            out.push_back(static_cast<char>(cp));
        }
        else if (cp < 0x800)
        {
            out.push_back(static_cast<char>(0xc0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
        }
        else if (cp < 0x10000)
        {
            out.push_back(static_cast<char>(0xe0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
        }
        else
        {
            out.push_back(static_cast<char>(0xf0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3f)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3f)));
        }
    }

    /**
     * @brief Decodes a NUL-terminated modified UTF-8 string into UTF-8.
     *
     * Modified UTF-8 encodes U+0000 as the two bytes C0 80 and code
     * points above the BMP as two 3-byte encoded surrogates. Both are
     * folded back into standard UTF-8. An unpaired surrogate is kept as
     * its 3-byte form.
     *
     * @param p First byte of the string data.
     * @param end One past the last readable byte.
     * @param out Receives the decoded string.
     * @return true if the terminator was found and every sequence was
     * well-formed, false otherwise.
     */
    inline bool decodeMutf8(const uint8_t* p, const uint8_t* end, std::string& out)
    {
        out.clear();
        auto continuation = [&](const uint8_t* q) {
            return q < end && (*q & 0xc0) == 0x80;
        };

        uint32_t pendingHigh = 0;
        while (p < end)
        {
            uint8_t b = *p;
            uint32_t unit;
            if (b == 0)
            {
                if (pendingHigh != 0) appendUtf8(out, pendingHigh);
                return true;
            }
            else if (b < 0x80)
            {
                unit = b;
                p += 1;
            }
            else if ((b & 0xe0) == 0xc0)
            {
                if (!continuation(p + 1)) return false;
                unit = ((b & 0x1f) << 6) | (p[1] & 0x3f);
                p += 2;
            }
            else if ((b & 0xf0) == 0xe0)
            {
                if (!continuation(p + 1) || !continuation(p + 2)) return false;
                unit = ((b & 0x0f) << 12) | ((p[1] & 0x3f) << 6) | (p[2] & 0x3f);
                p += 3;
            }
            else
            {
                return false;
            }

            if (pendingHigh != 0)
            {
                if (unit >= 0xdc00 && unit <= 0xdfff)
                {
                    appendUtf8(out, 0x10000 + ((pendingHigh - 0xd800) << 10) + (unit - 0xdc00));
                    pendingHigh = 0;
                    continue;
                }
                appendUtf8(out, pendingHigh);
                pendingHigh = 0;
            }

            if (unit >= 0xd800 && unit <= 0xdbff)
            {
                pendingHigh = unit;
            }
            else
            {
                appendUtf8(out, unit);
            }
        }
        return false;
    }

} // namespace utils
} // namespace dexview
