/**
 * @file AnnotationsDirectory.cpp
 * @brief Implementation of the annotations directory and its iterators.
 */

#include "dexview/AnnotationsDirectory.hpp"
#include "dexview/DexFile.hpp"

namespace dexview
{
    namespace
    {
        constexpr uint32_t kDirectoryHeaderSize = 16;
        constexpr uint32_t kPairSize = 8;
    }

    uint32_t AnnotationIterator::seekTo(uint32_t ordinal)
    {
        while (m_cursor < m_size)
        {
            uint32_t pairOffset = m_pairsOffset + m_cursor * kPairSize;
            uint32_t pending = m_file->readUint(pairOffset);
            if (pending > ordinal)
            {
                return 0;
            }

            ++m_cursor;
            if (pending == ordinal)
            {
                return m_file->readUint(pairOffset + 4);
            }
        }
        return 0;
    }

    AnnotationsDirectory AnnotationsDirectory::newOrEmpty(const DexFile& file, uint32_t offset)
    {
        AnnotationsDirectory directory;
        if (offset == 0)
        {
            return directory;
        }

        directory.m_file = &file;
        directory.m_classAnnotationsOffset = file.readUint(offset);
        directory.m_fieldCount = file.readUint(offset + 4);
        directory.m_methodCount = file.readUint(offset + 8);
        directory.m_parameterCount = file.readUint(offset + 12);
        directory.m_fieldsOffset = offset + kDirectoryHeaderSize;

        uint64_t pairs = static_cast<uint64_t>(directory.m_fieldCount) +
                         directory.m_methodCount + directory.m_parameterCount;
        file.checkRange(directory.m_fieldsOffset, pairs * kPairSize);
        return directory;
    }

    AnnotationSet AnnotationsDirectory::classAnnotations() const
    {
        if (m_file == nullptr)
        {
            return AnnotationSet();
        }
        return makeAnnotationSet(*m_file, m_classAnnotationsOffset);
    }

    AnnotationIterator AnnotationsDirectory::fieldAnnotationIterator() const
    {
        if (m_file == nullptr)
        {
            return AnnotationIterator();
        }
        return AnnotationIterator(*m_file, m_fieldsOffset, m_fieldCount);
    }

    AnnotationIterator AnnotationsDirectory::methodAnnotationIterator() const
    {
        if (m_file == nullptr)
        {
            return AnnotationIterator();
        }
        return AnnotationIterator(*m_file, m_fieldsOffset + m_fieldCount * kPairSize, m_methodCount);
    }

    AnnotationIterator AnnotationsDirectory::parameterAnnotationIterator() const
    {
        if (m_file == nullptr)
        {
            return AnnotationIterator();
        }
        uint32_t offset = m_fieldsOffset + (m_fieldCount + m_methodCount) * kPairSize;
        return AnnotationIterator(*m_file, offset, m_parameterCount);
    }

} // namespace dexview
