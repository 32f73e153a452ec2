/**
 * @file StaticValueIterator.hpp
 * @brief Positional cursor over a class's static initial values.
 *
 * The values form one encoded_array aligned with the class's static
 * fields in declaration order. The array may be shorter than the list
 * of statics; the remaining fields take their default value.
 */

#pragma once

#include "EncodedValue.hpp"
#include <cstdint>
#include <optional>

namespace dexview
{
    class DexFile;

    class StaticValueIterator
    {
    public:
        /**
         * @brief An iterator that is always exhausted.
         */
        StaticValueIterator() = default;

        /**
         * @brief Opens the encoded_array at @p offset, or an exhausted
         * iterator when @p offset is 0.
         * @throws MalformedEncoding if the array size cannot be read.
         */
        static StaticValueIterator newOrEmpty(const DexFile& file, uint32_t offset);

        /**
         * @brief Returns the next value and steps over it.
         * @return The value, or an empty optional once exhausted.
         */
        std::optional<EncodedValue> next();

        /**
         * @brief Steps over the next value without returning it.
         *
         * Consumes and validates exactly the bytes next() would.
         */
        void skip() { next(); }

        /// @brief Values not yet consumed.
        uint32_t remaining() const { return m_remaining; }

    private:
        StaticValueIterator(const DexFile& file, uint32_t offset, uint32_t size)
            : m_file(&file), m_offset(offset), m_remaining(size) {}

        const DexFile* m_file = nullptr;
        uint32_t m_offset = 0;
        uint32_t m_remaining = 0;
    };

} // namespace dexview
