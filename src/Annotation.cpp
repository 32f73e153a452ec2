/**
 * @file Annotation.cpp
 * @brief Implementation of the annotation views.
 */

#include "dexview/Annotation.hpp"
#include "dexview/DexReader.hpp"

namespace dexview
{
    uint8_t Annotation::visibility() const
    {
        return m_file->readUbyte(m_offset);
    }

    std::string Annotation::type() const
    {
        DexReader reader(*m_file, m_offset + 1);
        return m_file->getType(reader.readUleb128());
    }

    uint32_t Annotation::elementCount() const
    {
        DexReader reader(*m_file, m_offset + 1);
        reader.skipUleb128(); // type_idx
        return reader.readUleb128();
    }

    AnnotationSet makeAnnotationSet(const DexFile& file, uint32_t offset)
    {
        if (offset == 0)
        {
            return AnnotationSet();
        }

        uint32_t size = file.readUint(offset);
        file.checkRange(offset + 4, static_cast<uint64_t>(size) * 4);
        const DexFile* f = &file;
        return AnnotationSet(size, offset + 4, 4, [f](uint32_t entryOffset) {
            return Annotation(*f, f->readUint(entryOffset));
        });
    }

    FixedStrideList<AnnotationSet> makeAnnotationSetRefList(const DexFile& file, uint32_t offset)
    {
        if (offset == 0)
        {
            return FixedStrideList<AnnotationSet>();
        }

        uint32_t size = file.readUint(offset);
        file.checkRange(offset + 4, static_cast<uint64_t>(size) * 4);
        const DexFile* f = &file;
        return FixedStrideList<AnnotationSet>(size, offset + 4, 4, [f](uint32_t entryOffset) {
            return makeAnnotationSet(*f, f->readUint(entryOffset));
        });
    }

} // namespace dexview
