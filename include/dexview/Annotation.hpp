/**
 * @file Annotation.hpp
 * @brief Views of annotation_item and annotation sets.
 */

#pragma once

#include "FixedStrideList.hpp"
#include <cstdint>
#include <string>

namespace dexview
{
    class DexFile;

    /// @brief Retention of an annotation.
    enum class Visibility : uint8_t
    {
        Build   = 0x00,
        Runtime = 0x01,
        System  = 0x02
    };

    /**
     * @class Annotation
     * @brief One annotation_item: a visibility byte and an encoded_annotation.
     *
     * Only the header is read. Element values are left encoded.
     */
    class Annotation
    {
    public:
        Annotation(const DexFile& file, uint32_t offset)
            : m_file(&file), m_offset(offset) {}

        uint32_t offset() const { return m_offset; }

        /**
         * @brief The raw visibility byte (see Visibility).
         */
        uint8_t visibility() const;

        /// @brief Descriptor of the annotation type.
        std::string type() const;

        /// @brief Number of name/value elements.
        uint32_t elementCount() const;

    private:
        const DexFile* m_file;
        uint32_t m_offset;
    };

    /// An annotation_set_item: a size, then 4-byte offsets of annotation_items.
    using AnnotationSet = FixedStrideList<Annotation>;

    /**
     * @brief Views the annotation_set_item at @p offset.
     * @param offset Offset of the set, 0 for the empty set.
     * @throws MalformedEncoding if the declared size runs past the buffer.
     */
    AnnotationSet makeAnnotationSet(const DexFile& file, uint32_t offset);

    /**
     * @brief Views the annotation_set_ref_list at @p offset: one
     * annotation set per method parameter, possibly empty.
     * @param offset Offset of the list, 0 for the empty list.
     */
    FixedStrideList<AnnotationSet> makeAnnotationSetRefList(const DexFile& file, uint32_t offset);

} // namespace dexview
