/**
 * @file AnnotationsDirectory.hpp
 * @brief A class's annotations_directory_item and its ordinal iterators.
 *
 * The directory holds the class annotations plus three sparse tables of
 * (member ordinal, offset) pairs, each sorted by ordinal: annotated
 * fields, annotated methods, and annotated method parameters. Member
 * streams consult them through an AnnotationIterator, stepping it once
 * per member they produce or skip.
 */

#pragma once

#include "Annotation.hpp"
#include <cstdint>

namespace dexview
{
    class DexFile;

    /**
     * @class AnnotationIterator
     * @brief Forward cursor over one sorted (ordinal, offset) table.
     */
    class AnnotationIterator
    {
    public:
        /**
         * @brief An iterator over an empty table; it never matches.
         */
        AnnotationIterator() = default;

        AnnotationIterator(const DexFile& file, uint32_t pairsOffset, uint32_t size)
            : m_file(&file), m_pairsOffset(pairsOffset), m_size(size) {}

        /**
         * @brief Matches the table against the ordinal of the current member.
         *
         * Pairs with a smaller ordinal belong to members the stream has
         * already passed and are stepped over. If the next pending pair
         * has exactly @p ordinal, its offset is returned and the cursor
         * moves past it. Otherwise the cursor stays where it is.
         *
         * @param ordinal The member's table index. Successive calls must
         * pass increasing ordinals.
         * @return The pair's offset, or 0 if the member has no entry.
         */
        uint32_t seekTo(uint32_t ordinal);

        /// @brief Pairs not yet matched or stepped over.
        uint32_t remaining() const { return m_size - m_cursor; }

    private:
        const DexFile* m_file = nullptr;
        uint32_t m_pairsOffset = 0;
        uint32_t m_size = 0;
        uint32_t m_cursor = 0;
    };

    /**
     * @class AnnotationsDirectory
     * @brief Lazy view of an annotations_directory_item.
     */
    class AnnotationsDirectory
    {
    public:
        /**
         * @brief Reads the directory header at @p offset, or builds the
         * empty directory when @p offset is 0.
         * @throws MalformedEncoding if the declared tables run past the buffer.
         */
        static AnnotationsDirectory newOrEmpty(const DexFile& file, uint32_t offset);

        /// @brief Annotations on the class itself.
        AnnotationSet classAnnotations() const;

        AnnotationIterator fieldAnnotationIterator() const;
        AnnotationIterator methodAnnotationIterator() const;
        AnnotationIterator parameterAnnotationIterator() const;

        uint32_t annotatedFieldCount() const { return m_fieldCount; }
        uint32_t annotatedMethodCount() const { return m_methodCount; }
        uint32_t annotatedParameterCount() const { return m_parameterCount; }

    private:
        AnnotationsDirectory() = default;

        const DexFile* m_file = nullptr;
        uint32_t m_classAnnotationsOffset = 0;
        uint32_t m_fieldsOffset = 0;
        uint32_t m_fieldCount = 0;
        uint32_t m_methodCount = 0;
        uint32_t m_parameterCount = 0;
    };

} // namespace dexview
