/**
 * @file Method.cpp
 * @brief Implementation of the Method view.
 */

#include "dexview/Method.hpp"
#include "dexview/DexFile.hpp"
#include <utility>

namespace dexview
{
    uint32_t Method::tableSize(const DexFile& file)
    {
        return file.methodCount();
    }

    Method::Method(const DexFile& file, MemberEntry entry)
        : m_file(&file), m_entry(std::move(entry))
    {
    }

    std::string Method::name() const
    {
        return m_file->getString(m_file->methodId(m_entry.index).nameIndex);
    }

    std::string Method::definingClass() const
    {
        return m_file->getType(m_file->methodId(m_entry.index).classIndex);
    }

    std::string Method::returnType() const
    {
        ProtoId proto = m_file->protoId(m_file->methodId(m_entry.index).protoIndex);
        return m_file->getType(proto.returnTypeIndex);
    }

    FixedStrideList<std::string> Method::parameterTypes() const
    {
        ProtoId proto = m_file->protoId(m_file->methodId(m_entry.index).protoIndex);
        return m_file->typeList(proto.parametersOffset);
    }

    AnnotationSet Method::annotations() const
    {
        return makeAnnotationSet(*m_file, m_entry.annotationsOffset);
    }

    FixedStrideList<AnnotationSet> Method::parameterAnnotations() const
    {
        return makeAnnotationSetRefList(*m_file, m_entry.parameterAnnotationsOffset);
    }

} // namespace dexview
