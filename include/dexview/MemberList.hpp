/**
 * @file MemberList.hpp
 * @brief Sequential view over a delta-encoded member stream.
 *
 * A class's fields (and, after them, its methods) are stored as
 * consecutive entries of variable length. Each entry starts with the
 * difference between its table ordinal and the previous entry's, so
 * entry @c k can only be located and resolved by stepping over entries
 * 0..k-1. The stream is split in two runs (static then instance fields,
 * or direct then virtual methods) and the delta chain restarts at zero
 * at the start of each run.
 *
 * Every step, whether it materializes the member or skips it, also
 * advances the side channels bound to the stream: the annotation
 * iterators, matched by ordinal, and the static value iterator, matched
 * by position. Skipping and reading share one routine so they always
 * consume the same bytes and keep the side channels aligned.
 */

#pragma once

#include "AnnotationsDirectory.hpp"
#include "DexReader.hpp"
#include "Exceptions.hpp"
#include "ItemList.hpp"
#include "MemberEntry.hpp"
#include "StaticValueIterator.hpp"
#include <cstdint>
#include <functional>
#include <iterator>
#include <optional>
#include <string>
#include <utility>

namespace dexview
{
    /**
     * @class MemberList
     * @brief Index-addressable, forward-decoded list of Field or Method.
     *
     * T supplies the stream shape through kHasCodeOffset,
     * kHasInitialValue, kKind and tableSize(). Copies of the side-channel
     * iterators given at construction are kept untouched; each traversal
     * (and each run within it) starts from a fresh copy, so the list can
     * be traversed any number of times and from several threads.
     */
    template <typename T>
    class MemberList : public ItemList<T>
    {
    public:
        /**
         * @class Iterator
         * @brief One forward traversal of the stream.
         *
         * After size() steps, offset() is the offset just past the last
         * entry and previousIndex() is the last entry's ordinal. The
         * iterator keeps no reference to its list, so it stays valid
         * after the list is destroyed; only the DexFile must outlive it.
         */
        class Iterator
        {
        public:
            bool hasNext() const { return m_position < m_size; }

            /**
             * @brief Decodes the next member (readItem).
             * @throws IndexOutOfRange when the stream is exhausted.
             */
            T next()
            {
                MemberEntry entry;
                step(&entry);
                return T(*m_file, std::move(entry));
            }

            /**
             * @brief Steps over the next member without building it (skipItem).
             *
             * Consumes the same bytes, validates them the same way and
             * advances the side channels exactly as next() does.
             */
            void skip()
            {
                step(nullptr);
            }

            /// @brief Number of members read or skipped so far.
            uint32_t index() const { return m_position; }

            /// @brief Offset of the next entry to decode.
            uint32_t offset() const { return m_reader.offset(); }

            /// @brief Ordinal of the last member read or skipped.
            uint32_t previousIndex() const { return m_previousIndex; }

        private:
            friend class MemberList;

            explicit Iterator(const MemberList& list)
                : m_file(list.m_file),
                  m_size(list.m_size),
                  m_firstRunSize(list.m_firstRunSize),
                  m_reader(*list.m_file, list.m_startOffset),
                  m_runAnnotations(list.m_annotations),
                  m_runParameterAnnotations(list.m_parameterAnnotations),
                  m_annotations(list.m_annotations),
                  m_parameterAnnotations(list.m_parameterAnnotations),
                  m_staticValues(list.m_staticValues)
            {
            }

            void step(MemberEntry* out);

            // Copied from the list, so the iterator may outlive it.
            const DexFile* m_file;
            uint32_t m_size;
            uint32_t m_firstRunSize;
            DexReader m_reader;
            AnnotationIterator m_runAnnotations;
            AnnotationIterator m_runParameterAnnotations;
            AnnotationIterator m_annotations;
            AnnotationIterator m_parameterAnnotations;
            StaticValueIterator m_staticValues;
            uint32_t m_position = 0;
            uint32_t m_previousIndex = 0;
        };

        /**
         * @class const_iterator
         * @brief Range-for adapter over a single Iterator.
         */
        class const_iterator
        {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type = T;
            using difference_type = std::ptrdiff_t;
            using pointer = const T*;
            using reference = const T&;

            const_iterator() = default;

            const T& operator*() const { return *m_current; }
            const T* operator->() const { return &*m_current; }

            const_iterator& operator++()
            {
                advance();
                return *this;
            }

            bool operator==(const const_iterator& other) const
            {
                if (!m_current || !other.m_current)
                {
                    return m_current.has_value() == other.m_current.has_value();
                }
                return m_it->index() == other.m_it->index();
            }

            bool operator!=(const const_iterator& other) const { return !(*this == other); }

        private:
            friend class MemberList;

            explicit const_iterator(Iterator it) : m_it(std::move(it))
            {
                advance();
            }

            void advance()
            {
                if (m_it && m_it->hasNext())
                {
                    m_current.emplace(m_it->next());
                }
                else
                {
                    m_current.reset();
                }
            }

            std::optional<Iterator> m_it;
            std::optional<T> m_current;
        };

        /**
         * @brief Constructs the empty list.
         */
        MemberList() = default;

        /**
         * @brief Binds a list to the stream at @p startOffset.
         *
         * @param file The container.
         * @param startOffset Offset of the first entry.
         * @param firstRunSize Entries in the first run (statics or direct methods).
         * @param secondRunSize Entries in the second run (instance fields or virtual methods).
         * @param annotations Member annotations, matched by ordinal.
         * @param parameterAnnotations Parameter annotations, matched by ordinal.
         * @param staticValues Initial values, consumed once per first-run
         * entry when T has initial values.
         * @throws MalformedEncoding if the declared entries cannot fit in
         * the rest of the buffer.
         */
        MemberList(const DexFile& file,
                   uint32_t startOffset,
                   uint32_t firstRunSize,
                   uint32_t secondRunSize,
                   AnnotationIterator annotations,
                   AnnotationIterator parameterAnnotations,
                   StaticValueIterator staticValues)
            : m_file(&file),
              m_startOffset(startOffset),
              m_firstRunSize(firstRunSize),
              m_size(0),
              m_annotations(std::move(annotations)),
              m_parameterAnnotations(std::move(parameterAnnotations)),
              m_staticValues(std::move(staticValues))
        {
            // Every entry takes at least one byte per ULEB128 field.
            uint64_t count = static_cast<uint64_t>(firstRunSize) + secondRunSize;
            uint64_t minimumEntrySize = T::kHasCodeOffset ? 3 : 2;
            file.checkRange(startOffset, minimumEntrySize * count);
            m_size = static_cast<uint32_t>(count);
        }

        size_t size() const override { return m_size; }

        /**
         * @brief Starts a fresh traversal from the first entry.
         *
         * Only valid on a list bound to a stream; the empty list built
         * by the default constructor has nothing to traverse.
         */
        Iterator iterator() const { return Iterator(*this); }

        /**
         * @brief Decodes entry @p index by skipping every entry before it.
         * @throws IndexOutOfRange if index >= size().
         */
        T at(size_t index) const override
        {
            if (index >= m_size)
            {
                throw IndexOutOfRange(std::string(T::kKind) + " list", index, m_size);
            }

            Iterator it = iterator();
            for (size_t i = 0; i < index; ++i)
            {
                it.skip();
            }
            return it.next();
        }

        void forEach(const std::function<void(const T&)>& visitor) const override
        {
            if (m_file == nullptr)
            {
                return;
            }

            Iterator it = iterator();
            while (it.hasNext())
            {
                visitor(it.next());
            }
        }

        /// @brief Offset of the first entry.
        uint32_t startOffset() const { return m_startOffset; }

        /**
         * @brief Offset just past the last entry, found by skipping them all.
         */
        uint32_t endOffset() const
        {
            if (m_file == nullptr)
            {
                return m_startOffset;
            }

            Iterator it = iterator();
            while (it.hasNext())
            {
                it.skip();
            }
            return it.offset();
        }

        const_iterator begin() const
        {
            if (m_file == nullptr)
            {
                return const_iterator();
            }
            return const_iterator(iterator());
        }

        const_iterator end() const { return const_iterator(); }

    private:
        const DexFile* m_file = nullptr;
        uint32_t m_startOffset = 0;
        uint32_t m_firstRunSize = 0;
        uint32_t m_size = 0;
        AnnotationIterator m_annotations;
        AnnotationIterator m_parameterAnnotations;
        StaticValueIterator m_staticValues;
    };

    template <typename T>
    void MemberList<T>::Iterator::step(MemberEntry* out)
    {
        if (!hasNext())
        {
            throw IndexOutOfRange(std::string(T::kKind) + " stream", m_position, m_size);
        }

        bool firstInRun = m_position == 0 || m_position == m_firstRunSize;
        if (m_position == m_firstRunSize)
        {
            // The second run restarts the delta chain, and its ordinals
            // may be lower than the first run's.
            m_previousIndex = 0;
            m_annotations = m_runAnnotations;
            m_parameterAnnotations = m_runParameterAnnotations;
        }

        uint32_t entryOffset = m_reader.offset();
        uint32_t delta = m_reader.readUleb128();
        if (delta == 0 && !firstInRun)
        {
            throw MalformedEncoding(
                "Repeated " + std::string(T::kKind) + " index " +
                std::to_string(m_previousIndex) + " at offset " + std::to_string(entryOffset)
            );
        }

        uint64_t index = static_cast<uint64_t>(m_previousIndex) + delta;
        uint32_t tableSize = T::tableSize(*m_file);
        if (index >= tableSize)
        {
            throw InconsistentHeader(
                std::string(T::kKind) + " index " + std::to_string(index) +
                " at offset " + std::to_string(entryOffset) +
                " exceeds the table size " + std::to_string(tableSize)
            );
        }

        uint32_t accessFlags = m_reader.readUleb128();
        uint32_t codeOffset = 0;
        if constexpr (T::kHasCodeOffset)
        {
            codeOffset = m_reader.readUleb128();
        }

        uint32_t ordinal = static_cast<uint32_t>(index);
        uint32_t annotationsOffset = m_annotations.seekTo(ordinal);
        uint32_t parameterAnnotationsOffset = m_parameterAnnotations.seekTo(ordinal);

        std::optional<EncodedValue> initialValue;
        if constexpr (T::kHasInitialValue)
        {
            if (m_position < m_firstRunSize)
            {
                initialValue = m_staticValues.next();
            }
        }

        m_previousIndex = ordinal;
        ++m_position;

        if (out != nullptr)
        {
            out->index = ordinal;
            out->accessFlags = accessFlags;
            out->codeOffset = codeOffset;
            out->annotationsOffset = annotationsOffset;
            out->parameterAnnotationsOffset = parameterAnnotationsOffset;
            out->initialValue = std::move(initialValue);
        }
    }

} // namespace dexview
