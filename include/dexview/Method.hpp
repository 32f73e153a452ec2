/**
 * @file Method.hpp
 * @brief View of one method produced by a class's member stream.
 */

#pragma once

#include "Annotation.hpp"
#include "FixedStrideList.hpp"
#include "MemberEntry.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace dexview
{
    class DexFile;

    /**
     * @class Method
     * @brief A method definition. The code item is not decoded.
     */
    class Method
    {
    public:
        // --- Member stream traits ---
        static constexpr bool kHasCodeOffset = true;
        static constexpr bool kHasInitialValue = false;
        static constexpr std::string_view kKind = "method";

        /// @brief Size of the global table the ordinals index into.
        static uint32_t tableSize(const DexFile& file);

        Method(const DexFile& file, MemberEntry entry);

        uint32_t index() const { return m_entry.index; }
        uint32_t accessFlags() const { return m_entry.accessFlags; }

        /// @brief Offset of the code_item, 0 for abstract and native methods.
        uint32_t codeOffset() const { return m_entry.codeOffset; }

        std::string name() const;
        std::string definingClass() const;
        std::string returnType() const;

        /// @brief Descriptors of the declared parameter types.
        FixedStrideList<std::string> parameterTypes() const;

        AnnotationSet annotations() const;

        /**
         * @brief One annotation set per parameter; empty if no parameter
         * is annotated.
         */
        FixedStrideList<AnnotationSet> parameterAnnotations() const;

        const MemberEntry& entry() const { return m_entry; }

    private:
        const DexFile* m_file;
        MemberEntry m_entry;
    };

} // namespace dexview
