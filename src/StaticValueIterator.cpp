/**
 * @file StaticValueIterator.cpp
 * @brief Implementation of the static initial value cursor.
 */

#include "dexview/StaticValueIterator.hpp"
#include "dexview/DexReader.hpp"

namespace dexview
{
    StaticValueIterator StaticValueIterator::newOrEmpty(const DexFile& file, uint32_t offset)
    {
        if (offset == 0)
        {
            return StaticValueIterator();
        }

        DexReader reader(file, offset);
        uint32_t size = reader.readUleb128();
        return StaticValueIterator(file, reader.offset(), size);
    }

    std::optional<EncodedValue> StaticValueIterator::next()
    {
        if (m_remaining == 0)
        {
            return std::nullopt;
        }

        DexReader reader(*m_file, m_offset);
        EncodedValue value = EncodedValue::read(reader);
        m_offset = reader.offset();
        --m_remaining;
        return value;
    }

} // namespace dexview
