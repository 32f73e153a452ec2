/**
 * @file ClassDef.cpp
 * @brief Implementation of the ClassDef view.
 */

#include "dexview/ClassDef.hpp"
#include "dexview/AnnotationsDirectory.hpp"
#include "dexview/DexFile.hpp"
#include "dexview/DexReader.hpp"
#include "dexview/StaticValueIterator.hpp"

namespace dexview
{
    namespace
    {
        // class_def_item field offsets
        constexpr uint32_t ACCESS_FLAGS_OFFSET = 4;
        constexpr uint32_t SUPERCLASS_OFFSET = 8;
        constexpr uint32_t INTERFACES_OFFSET = 12;
        constexpr uint32_t SOURCE_FILE_OFFSET = 16;
        constexpr uint32_t ANNOTATIONS_OFFSET = 20;
        constexpr uint32_t CLASS_DATA_OFFSET = 24;
        constexpr uint32_t STATIC_VALUES_OFFSET = 28;

        // Both 0 and NO_INDEX mark an absent superclass or source file.
        bool isAbsent(uint32_t index)
        {
            return index == 0 || index == NO_INDEX;
        }
    }

    ClassDef::ClassDef(const DexFile& file, uint32_t classDefOffset)
        : m_file(&file), m_offset(classDefOffset)
    {
        file.checkRange(classDefOffset, kClassDefSize);

        m_name = file.getType(file.readUint(classDefOffset));
        m_accessFlags = file.readUint(classDefOffset + ACCESS_FLAGS_OFFSET);

        uint32_t superclassIndex = file.readUint(classDefOffset + SUPERCLASS_OFFSET);
        if (!isAbsent(superclassIndex))
        {
            m_superclass = file.getType(superclassIndex);
        }

        uint32_t sourceFileIndex = file.readUint(classDefOffset + SOURCE_FILE_OFFSET);
        if (!isAbsent(sourceFileIndex))
        {
            m_sourceFile = file.getString(sourceFileIndex);
        }

        m_interfacesOffset = file.readUint(classDefOffset + INTERFACES_OFFSET);
        m_annotationsOffset = file.readUint(classDefOffset + ANNOTATIONS_OFFSET);
        m_classDataOffset = file.readUint(classDefOffset + CLASS_DATA_OFFSET);
        m_staticValuesOffset = file.readUint(classDefOffset + STATIC_VALUES_OFFSET);
    }

    FixedStrideList<std::string> ClassDef::interfaces() const
    {
        return m_file->typeList(m_interfacesOffset);
    }

    AnnotationSet ClassDef::annotations() const
    {
        return AnnotationsDirectory::newOrEmpty(*m_file, m_annotationsOffset).classAnnotations();
    }

    ClassDef::ClassDataHeader ClassDef::readClassDataHeader() const
    {
        ClassDataHeader header;
        if (m_classDataOffset == 0)
        {
            return header;
        }

        DexReader reader(*m_file, m_classDataOffset);
        header.staticFields = reader.readUleb128();
        header.instanceFields = reader.readUleb128();
        header.directMethods = reader.readUleb128();
        header.virtualMethods = reader.readUleb128();
        header.firstEntryOffset = reader.offset();
        return header;
    }

    MemberList<Field> ClassDef::fields() const
    {
        ClassDataHeader header = readClassDataHeader();
        if (header.staticFields == 0 && header.instanceFields == 0)
        {
            return MemberList<Field>();
        }

        auto directory = AnnotationsDirectory::newOrEmpty(*m_file, m_annotationsOffset);
        return MemberList<Field>(
            *m_file,
            header.firstEntryOffset,
            header.staticFields,
            header.instanceFields,
            directory.fieldAnnotationIterator(),
            AnnotationIterator(),
            StaticValueIterator::newOrEmpty(*m_file, m_staticValuesOffset)
        );
    }

    MemberList<Method> ClassDef::methods() const
    {
        ClassDataHeader header = readClassDataHeader();
        if (header.directMethods == 0 && header.virtualMethods == 0)
        {
            return MemberList<Method>();
        }

        uint32_t methodsOffset = header.firstEntryOffset;
        if (header.staticFields != 0 || header.instanceFields != 0)
        {
            methodsOffset = fields().endOffset();
        }

        auto directory = AnnotationsDirectory::newOrEmpty(*m_file, m_annotationsOffset);
        return MemberList<Method>(
            *m_file,
            methodsOffset,
            header.directMethods,
            header.virtualMethods,
            directory.methodAnnotationIterator(),
            directory.parameterAnnotationIterator(),
            StaticValueIterator()
        );
    }

    uint32_t ClassDef::staticFieldCount() const
    {
        return readClassDataHeader().staticFields;
    }

    uint32_t ClassDef::instanceFieldCount() const
    {
        return readClassDataHeader().instanceFields;
    }

    uint32_t ClassDef::directMethodCount() const
    {
        return readClassDataHeader().directMethods;
    }

    uint32_t ClassDef::virtualMethodCount() const
    {
        return readClassDataHeader().virtualMethods;
    }

} // namespace dexview
