/**
 * @file FixedStrideList.hpp
 * @brief Random-access view over a table of equally sized items.
 *
 * Used for every table whose element width is constant: type lists,
 * annotation sets, annotation set ref lists and the class definition
 * table. Element @c i lives at @c firstItemOffset + i * stride, so no
 * traversal state is kept and concurrent readers need no coordination.
 */

#pragma once

#include "ItemList.hpp"
#include "Exceptions.hpp"
#include <cstdint>
#include <functional>
#include <iterator>
#include <utility>

namespace dexview
{
    template <typename T>
    class FixedStrideList : public ItemList<T>
    {
    public:
        /// Builds the element stored at a given byte offset.
        using Reader = std::function<T(uint32_t itemOffset)>;

        /**
         * @brief Constructs the empty list.
         */
        FixedStrideList() = default;

        /**
         * @brief Constructs a view over @p size items.
         *
         * The owner reads @p size from the table header and checks that
         * the items fit in the buffer before building the view.
         *
         * @param size Number of items.
         * @param firstItemOffset Byte offset of item 0.
         * @param stride Width of one item in bytes.
         * @param reader Decodes one item from its offset.
         */
        FixedStrideList(uint32_t size, uint32_t firstItemOffset, uint32_t stride, Reader reader)
            : m_size(size),
              m_firstItemOffset(firstItemOffset),
              m_stride(stride),
              m_reader(std::move(reader))
        {
        }

        size_t size() const override { return m_size; }

        T at(size_t index) const override
        {
            return m_reader(itemOffset(index));
        }

        /**
         * @brief Byte offset of an item, without decoding it.
         * @throws IndexOutOfRange if index >= size().
         */
        uint32_t itemOffset(size_t index) const
        {
            if (index >= m_size)
            {
                throw IndexOutOfRange("FixedStrideList", index, m_size);
            }
            return m_firstItemOffset + static_cast<uint32_t>(index) * m_stride;
        }

        uint32_t stride() const { return m_stride; }

        class const_iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = void;
            using reference = T;

            const_iterator() = default;
            const_iterator(const FixedStrideList* list, size_t index)
                : m_list(list), m_index(index) {}

            T operator*() const { return m_list->at(m_index); }

            const_iterator& operator++()
            {
                ++m_index;
                return *this;
            }

            const_iterator operator++(int)
            {
                const_iterator previous = *this;
                ++m_index;
                return previous;
            }

            bool operator==(const const_iterator& other) const { return m_index == other.m_index; }
            bool operator!=(const const_iterator& other) const { return m_index != other.m_index; }

        private:
            const FixedStrideList* m_list = nullptr;
            size_t m_index = 0;
        };

        const_iterator begin() const { return const_iterator(this, 0); }
        const_iterator end() const { return const_iterator(this, m_size); }

    private:
        uint32_t m_size = 0;
        uint32_t m_firstItemOffset = 0;
        uint32_t m_stride = 0;
        Reader m_reader;
    };

} // namespace dexview
