/**
 * @file Field.cpp
 * @brief Implementation of the Field view.
 */

#include "dexview/Field.hpp"
#include "dexview/AccessFlags.hpp"
#include "dexview/DexFile.hpp"
#include <utility>

namespace dexview
{
    uint32_t Field::tableSize(const DexFile& file)
    {
        return file.fieldCount();
    }

    Field::Field(const DexFile& file, MemberEntry entry)
        : m_file(&file), m_entry(std::move(entry))
    {
    }

    bool Field::isStatic() const
    {
        return (m_entry.accessFlags & ACC_STATIC) != 0;
    }

    std::string Field::name() const
    {
        return m_file->getString(m_file->fieldId(m_entry.index).nameIndex);
    }

    std::string Field::type() const
    {
        return m_file->getType(m_file->fieldId(m_entry.index).typeIndex);
    }

    std::string Field::definingClass() const
    {
        return m_file->getType(m_file->fieldId(m_entry.index).classIndex);
    }

    AnnotationSet Field::annotations() const
    {
        return makeAnnotationSet(*m_file, m_entry.annotationsOffset);
    }

} // namespace dexview
