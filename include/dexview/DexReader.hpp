/**
 * @file DexReader.hpp
 * @brief A forward cursor over the container buffer.
 *
 * Sequential decoders (member streams, encoded values) advance a
 * DexReader past exactly the bytes they consume. Copying a reader
 * forks the cursor; the buffer itself is shared.
 */

#pragma once

#include "DexFile.hpp"
#include <cstdint>

namespace dexview
{
    class DexReader
    {
    public:
        DexReader(const DexFile& file, uint32_t offset)
            : m_file(&file), m_offset(offset) {}

        const DexFile& file() const { return *m_file; }

        uint32_t offset() const { return m_offset; }
        void setOffset(uint32_t offset) { m_offset = offset; }

        uint8_t readUbyte()
        {
            uint8_t value = m_file->readUbyte(m_offset);
            m_offset += 1;
            return value;
        }

        uint64_t readUnsigned(size_t width)
        {
            uint64_t value = m_file->readUnsigned(m_offset, width);
            m_offset += static_cast<uint32_t>(width);
            return value;
        }

        uint32_t readUleb128()
        {
            uint32_t value = 0;
            m_offset += m_file->readUleb128(m_offset, value);
            return value;
        }

        /**
         * @brief Steps over one ULEB128 value.
         *
         * The value is fully validated; skipping is not a weaker check
         * than reading.
         */
        void skipUleb128()
        {
            [[maybe_unused]] uint32_t ignored = readUleb128();
        }

        /**
         * @brief Steps over @p length raw bytes.
         * @throws MalformedEncoding if they run past the buffer.
         */
        void skip(uint32_t length)
        {
            m_file->checkRange(m_offset, length);
            m_offset += length;
        }

    private:
        const DexFile* m_file;
        uint32_t m_offset;
    };

} // namespace dexview
