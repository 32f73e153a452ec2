/**
 * @file Field.hpp
 * @brief View of one field produced by a class's member stream.
 */

#pragma once

#include "Annotation.hpp"
#include "MemberEntry.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace dexview
{
    class DexFile;

    /**
     * @class Field
     * @brief A field definition. Names and types are resolved on each call.
     */
    class Field
    {
    public:
        // --- Member stream traits ---
        static constexpr bool kHasCodeOffset = false;
        static constexpr bool kHasInitialValue = true;
        static constexpr std::string_view kKind = "field";

        /// @brief Size of the global table the ordinals index into.
        static uint32_t tableSize(const DexFile& file);

        Field(const DexFile& file, MemberEntry entry);

        uint32_t index() const { return m_entry.index; }
        uint32_t accessFlags() const { return m_entry.accessFlags; }
        bool isStatic() const;

        std::string name() const;

        /// @brief Descriptor of the field's type.
        std::string type() const;

        /// @brief Descriptor of the class that declares the field.
        std::string definingClass() const;

        /**
         * @brief The explicit initial value of a static field.
         * @return Empty for instance fields and for statics without one.
         */
        const std::optional<EncodedValue>& initialValue() const { return m_entry.initialValue; }

        AnnotationSet annotations() const;

        const MemberEntry& entry() const { return m_entry; }

    private:
        const DexFile* m_file;
        MemberEntry m_entry;
    };

} // namespace dexview
