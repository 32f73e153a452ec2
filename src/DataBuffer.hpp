/**
 * @file DataBuffer.hpp
 * @brief Internal helper class to read from a byte buffer.
 *
 * This class wraps a std::span (C++20) and provides bounds-checked
 * methods to read data from specific offsets. It is an internal
 * implementation detail of DexFile; every read failure is raised as
 * MalformedEncoding.
 */

#pragma once

#include <cstdint>
#include <string>
#include <span> // Use C++20's span for a non-owning view
#include "dexview/Exceptions.hpp"
#include "utils/BinaryIO.hpp" // Use the central utility

namespace dexview
{
    class DataBuffer
    {
    public:
        DataBuffer() = default;

        /**
         * @brief Sets the internal view to a block of memory.
         * @param data A span of bytes to view.
         */
        void setData(std::span<const uint8_t> data)
        {
            m_span = data;
        }

        /// @brief Total number of bytes in view.
        size_t size() const { return m_span.size(); }

        /// @brief Pointer to the first byte in view.
        const uint8_t* data() const { return m_span.data(); }

        /**
         * @brief Reads a single unsigned byte.
         * @param offset Byte offset to read from.
         */
        uint8_t readUbyte(uint32_t offset) const
        {
            checkBounds(offset, sizeof(uint8_t));
            return m_span[offset];
        }

        /**
         * @brief Reads a 2-byte little-endian unsigned short.
         * @param offset Byte offset to read from.
         */
        uint16_t readUshort(uint32_t offset) const
        {
            checkBounds(offset, sizeof(uint16_t));
            return utils::readLeUshort(m_span.data() + offset);
        }

        /**
         * @brief Reads a 4-byte little-endian unsigned integer.
         * @param offset Byte offset to read from.
         */
        uint32_t readUint(uint32_t offset) const
        {
            checkBounds(offset, sizeof(uint32_t));
            return utils::readLeUint(m_span.data() + offset);
        }

        /**
         * @brief Reads a little-endian unsigned value of 1 to 8 bytes.
         * @param offset Byte offset to read from.
         * @param width Number of bytes.
         */
        uint64_t readUnsigned(uint32_t offset, size_t width) const
        {
            checkBounds(offset, width);
            return utils::readLeUnsigned(m_span.data() + offset, width);
        }

        /**
         * @brief Decodes a ULEB128 value.
         * @param offset Byte offset of the first byte of the encoding.
         * @param value Receives the decoded value.
         * @return The number of bytes consumed.
         * @throws MalformedEncoding if the value does not terminate within
         * the buffer or does not fit in 32 bits.
         */
        uint32_t readUleb128(uint32_t offset, uint32_t& value) const
        {
            checkBounds(offset, 1);
            size_t length = utils::decodeUleb128(
                m_span.data() + offset, m_span.data() + m_span.size(), value);
            if (length == 0)
            {
                throw MalformedEncoding(
                    "Invalid ULEB128 value at offset " + std::to_string(offset)
                );
            }
            return static_cast<uint32_t>(length);
        }

        /**
         * @brief Decodes a NUL-terminated modified UTF-8 string.
         * @param offset Byte offset of the first character.
         * @throws MalformedEncoding on a missing terminator or a bad sequence.
         */
        std::string readMutf8(uint32_t offset) const
        {
            checkBounds(offset, 1);
            std::string result;
            if (!utils::decodeMutf8(m_span.data() + offset,
                                    m_span.data() + m_span.size(), result))
            {
                throw MalformedEncoding(
                    "Invalid string data at offset " + std::to_string(offset)
                );
            }
            return result;
        }

        /**
         * @brief Checks if a read is within the buffer bounds.
         * @throws MalformedEncoding if the read is invalid.
         */
        void checkBounds(uint64_t offset, uint64_t readSize) const
        {
            if (offset + readSize > m_span.size())
            {
                throw MalformedEncoding(
                    "Read offset " + std::to_string(offset) +
                    " with size " + std::to_string(readSize) +
                    " is out of bounds for buffer of size " +
                    std::to_string(m_span.size())
                );
            }
        }

    private:
        /// @brief A non-owning view of the container buffer.
        std::span<const uint8_t> m_span;
    };

} // namespace dexview
