/**
 * @file ClassDef.hpp
 * @brief Lazy view of one class definition.
 *
 * The fixed-width class_def_item header is read when the view is built.
 * Interfaces, annotations, fields and methods are decoded on every
 * accessor call from the offsets it holds; nothing is cached, so each
 * call returns an independent list.
 *
 * class_def_item layout (offsets from the record's base):
 *   0  type index           4  access flags
 *   8  superclass index     12 interfaces offset
 *   16 source file index    20 annotations directory offset
 *   24 class data offset    28 static values offset
 */

#pragma once

#include "Annotation.hpp"
#include "Field.hpp"
#include "FixedStrideList.hpp"
#include "MemberList.hpp"
#include "Method.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace dexview
{
    class DexFile;

    /**
     * @class ClassDef
     * @brief A class definition over the container buffer.
     */
    class ClassDef
    {
    public:
        /**
         * @brief Reads the class_def_item at @p classDefOffset.
         * @throws MalformedEncoding, IndexOutOfRange if the header or the
         * names it references cannot be resolved.
         */
        ClassDef(const DexFile& file, uint32_t classDefOffset);

        // --- Eager attributes ---

        /// @brief Descriptor of the class, e.g. "Lcom/example/Foo;".
        const std::string& name() const { return m_name; }

        uint32_t accessFlags() const { return m_accessFlags; }

        /**
         * @brief Descriptor of the superclass; absent (std::nullopt) for java.lang.Object.
         *
         * A superclass or source file index of 0 or NO_INDEX is absent.
         */
        const std::optional<std::string>& superclass() const { return m_superclass; }

        const std::optional<std::string>& sourceFile() const { return m_sourceFile; }

        // --- Lazy attributes ---

        /// @brief Descriptors of the directly implemented interfaces.
        FixedStrideList<std::string> interfaces() const;

        /// @brief Annotations on the class itself.
        AnnotationSet annotations() const;

        /**
         * @brief Static fields, then instance fields.
         *
         * Static fields carry their initial value, if the class has one
         * for them. Fields and methods carry their annotations.
         */
        MemberList<Field> fields() const;

        /**
         * @brief Direct methods, then virtual methods.
         *
         * The method entries follow the field entries, so the fields are
         * skipped to locate them.
         */
        MemberList<Method> methods() const;

        uint32_t staticFieldCount() const;
        uint32_t instanceFieldCount() const;
        uint32_t directMethodCount() const;
        uint32_t virtualMethodCount() const;

        // --- Raw offsets ---

        uint32_t offset() const { return m_offset; }
        uint32_t interfacesOffset() const { return m_interfacesOffset; }
        uint32_t annotationsOffset() const { return m_annotationsOffset; }
        uint32_t classDataOffset() const { return m_classDataOffset; }
        uint32_t staticValuesOffset() const { return m_staticValuesOffset; }

    private:
        /// Member counts from the class_data_item header.
        struct ClassDataHeader
        {
            uint32_t staticFields = 0;
            uint32_t instanceFields = 0;
            uint32_t directMethods = 0;
            uint32_t virtualMethods = 0;
            uint32_t firstEntryOffset = 0;
        };

        ClassDataHeader readClassDataHeader() const;

        const DexFile* m_file;
        uint32_t m_offset;

        std::string m_name;
        uint32_t m_accessFlags;
        std::optional<std::string> m_superclass;
        std::optional<std::string> m_sourceFile;

        uint32_t m_interfacesOffset;
        uint32_t m_annotationsOffset;
        uint32_t m_classDataOffset;
        uint32_t m_staticValuesOffset;
    };

} // namespace dexview
