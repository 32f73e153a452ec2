/**
 * @file DexFile.cpp
 * @brief Implementation of the DexFile class.
 */

#include "dexview/DexFile.hpp"
#include "dexview/ClassDef.hpp"
#include "dexview/Exceptions.hpp"
#include "DataBuffer.hpp"
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <vector>

namespace dexview
{
    namespace
    {
        constexpr uint32_t ENDIAN_CONSTANT = 0x12345678;

        // header_item field offsets
        constexpr uint32_t FILE_SIZE_OFFSET = 32;
        constexpr uint32_t HEADER_SIZE_OFFSET = 36;
        constexpr uint32_t ENDIAN_TAG_OFFSET = 40;
        constexpr uint32_t STRING_IDS_OFFSET = 56;
        constexpr uint32_t TYPE_IDS_OFFSET = 64;
        constexpr uint32_t PROTO_IDS_OFFSET = 72;
        constexpr uint32_t FIELD_IDS_OFFSET = 80;
        constexpr uint32_t METHOD_IDS_OFFSET = 88;
        constexpr uint32_t CLASS_DEFS_OFFSET = 96;

        // id item widths
        constexpr uint32_t STRING_ID_SIZE = 4;
        constexpr uint32_t TYPE_ID_SIZE = 4;
        constexpr uint32_t PROTO_ID_SIZE = 12;
        constexpr uint32_t FIELD_ID_SIZE = 8;
        constexpr uint32_t METHOD_ID_SIZE = 8;

        constexpr uint32_t MIN_VERSION = 35;
        constexpr uint32_t MAX_VERSION = 39;
    }

    /**
     * @struct DexFile::Impl
     * @brief Private implementation (PIMPL) struct for DexFile.
     */
    struct DexFile::Impl
    {
        /// @brief A size/offset pair from the header.
        struct Table
        {
            uint32_t size = 0;
            uint32_t offset = 0;
        };

        std::vector<uint8_t> ownedData; // Empty when the buffer is borrowed
        DataBuffer buffer;              // The non-owning view

        uint32_t version = 0;
        Table stringIds;
        Table typeIds;
        Table protoIds;
        Table fieldIds;
        Table methodIds;
        Table classDefs;

        explicit Impl(const std::string& filepath)
        {
            std::ifstream stream(filepath, std::ios::binary);
            if (!stream.is_open())
            {
                throw std::runtime_error("Failed to open file: " + filepath);
            }

            ownedData.assign(std::istreambuf_iterator<char>(stream),
                             std::istreambuf_iterator<char>());
            if (stream.bad())
            {
                throw std::runtime_error("Failed to read file: " + filepath);
            }

            buffer.setData(ownedData);
            readHeader();
        }

        explicit Impl(std::span<const uint8_t> data)
        {
            buffer.setData(data);
            readHeader();
        }

        void readHeader();
        Table readTable(uint32_t headerOffset, uint32_t itemSize, const char* name) const;

        /**
         * @brief Offset of entry @p index in @p table.
         * @throws IndexOutOfRange if index >= table.size.
         */
        static uint32_t entryOffset(const Table& table, uint32_t index, uint32_t itemSize,
                                    const char* name)
        {
            if (index >= table.size)
            {
                throw IndexOutOfRange(name, index, table.size);
            }
            return table.offset + index * itemSize;
        }
    };

    void DexFile::Impl::readHeader()
    {
        buffer.checkBounds(0, kHeaderSize);

        const uint8_t* magic = buffer.data();
        bool digits = magic[4] >= '0' && magic[4] <= '9' &&
                      magic[5] >= '0' && magic[5] <= '9' &&
                      magic[6] >= '0' && magic[6] <= '9';
        if (magic[0] != 'd' || magic[1] != 'e' || magic[2] != 'x' || magic[3] != '\n' ||
            !digits || magic[7] != '\0')
        {
            throw InconsistentHeader("Not a dex file: bad magic");
        }

        version = (magic[4] - '0') * 100 + (magic[5] - '0') * 10 + (magic[6] - '0');
        if (version < MIN_VERSION || version > MAX_VERSION)
        {
            throw InconsistentHeader("Unsupported dex version " + std::to_string(version));
        }

        uint32_t endianTag = buffer.readUint(ENDIAN_TAG_OFFSET);
        if (endianTag != ENDIAN_CONSTANT)
        {
            throw InconsistentHeader("Unsupported endian tag " + std::to_string(endianTag));
        }

        uint32_t headerSize = buffer.readUint(HEADER_SIZE_OFFSET);
        if (headerSize != kHeaderSize)
        {
            throw InconsistentHeader("Unexpected header size " + std::to_string(headerSize));
        }

        uint32_t fileSize = buffer.readUint(FILE_SIZE_OFFSET);
        if (fileSize > buffer.size())
        {
            throw InconsistentHeader(
                "Declared file size " + std::to_string(fileSize) +
                " exceeds buffer size " + std::to_string(buffer.size())
            );
        }

        stringIds = readTable(STRING_IDS_OFFSET, STRING_ID_SIZE, "string_ids");
        typeIds   = readTable(TYPE_IDS_OFFSET, TYPE_ID_SIZE, "type_ids");
        protoIds  = readTable(PROTO_IDS_OFFSET, PROTO_ID_SIZE, "proto_ids");
        fieldIds  = readTable(FIELD_IDS_OFFSET, FIELD_ID_SIZE, "field_ids");
        methodIds = readTable(METHOD_IDS_OFFSET, METHOD_ID_SIZE, "method_ids");
        classDefs = readTable(CLASS_DEFS_OFFSET, kClassDefSize, "class_defs");
    }

    DexFile::Impl::Table DexFile::Impl::readTable(uint32_t headerOffset, uint32_t itemSize,
                                                  const char* name) const
    {
        Table table;
        table.size = buffer.readUint(headerOffset);
        table.offset = buffer.readUint(headerOffset + 4);

        uint64_t end = static_cast<uint64_t>(table.offset) +
                       static_cast<uint64_t>(table.size) * itemSize;
        if (table.size > 0 && end > buffer.size())
        {
            throw InconsistentHeader(
                std::string(name) + " table of " + std::to_string(table.size) +
                " entries at offset " + std::to_string(table.offset) +
                " is out of bounds for buffer of size " + std::to_string(buffer.size())
            );
        }
        return table;
    }

    // --- Construction ---

    DexFile::DexFile(const std::string& filepath)
        : m_impl(std::make_unique<Impl>(filepath))
    {
    }

    DexFile::DexFile(std::span<const uint8_t> data)
        : m_impl(std::make_unique<Impl>(data))
    {
    }

    DexFile::~DexFile()
    {
    }

    // --- Primitive Reads ---

    size_t DexFile::size() const
    {
        return m_impl->buffer.size();
    }

    uint8_t DexFile::readUbyte(uint32_t offset) const
    {
        return m_impl->buffer.readUbyte(offset);
    }

    uint16_t DexFile::readUshort(uint32_t offset) const
    {
        return m_impl->buffer.readUshort(offset);
    }

    uint32_t DexFile::readUint(uint32_t offset) const
    {
        return m_impl->buffer.readUint(offset);
    }

    uint64_t DexFile::readUnsigned(uint32_t offset, size_t width) const
    {
        return m_impl->buffer.readUnsigned(offset, width);
    }

    uint32_t DexFile::readUleb128(uint32_t offset, uint32_t& value) const
    {
        return m_impl->buffer.readUleb128(offset, value);
    }

    void DexFile::checkRange(uint32_t offset, uint64_t length) const
    {
        m_impl->buffer.checkBounds(offset, length);
    }

    // --- Table Lookups ---

    std::string DexFile::getString(uint32_t index) const
    {
        uint32_t idOffset = Impl::entryOffset(m_impl->stringIds, index, STRING_ID_SIZE, "string index");
        uint32_t dataOffset = readUint(idOffset);

        uint32_t utf16Length = 0;
        uint32_t prefix = readUleb128(dataOffset, utf16Length);
        return m_impl->buffer.readMutf8(dataOffset + prefix);
    }

    std::optional<std::string> DexFile::getOptionalString(uint32_t index) const
    {
        if (index == NO_INDEX)
        {
            return std::nullopt;
        }
        return getString(index);
    }

    std::string DexFile::getType(uint32_t index) const
    {
        uint32_t idOffset = Impl::entryOffset(m_impl->typeIds, index, TYPE_ID_SIZE, "type index");
        return getString(readUint(idOffset));
    }

    std::optional<std::string> DexFile::getOptionalType(uint32_t index) const
    {
        if (index == NO_INDEX)
        {
            return std::nullopt;
        }
        return getType(index);
    }

    FieldId DexFile::fieldId(uint32_t index) const
    {
        uint32_t o = Impl::entryOffset(m_impl->fieldIds, index, FIELD_ID_SIZE, "field index");
        return FieldId{readUshort(o), readUshort(o + 2), readUint(o + 4)};
    }

    MethodId DexFile::methodId(uint32_t index) const
    {
        uint32_t o = Impl::entryOffset(m_impl->methodIds, index, METHOD_ID_SIZE, "method index");
        return MethodId{readUshort(o), readUshort(o + 2), readUint(o + 4)};
    }

    ProtoId DexFile::protoId(uint32_t index) const
    {
        uint32_t o = Impl::entryOffset(m_impl->protoIds, index, PROTO_ID_SIZE, "proto index");
        return ProtoId{readUint(o), readUint(o + 4), readUint(o + 8)};
    }

    FixedStrideList<std::string> DexFile::typeList(uint32_t offset) const
    {
        if (offset == 0)
        {
            return FixedStrideList<std::string>();
        }

        uint32_t size = readUint(offset);
        checkRange(offset + 4, static_cast<uint64_t>(size) * 2);
        return FixedStrideList<std::string>(size, offset + 4, 2, [this](uint32_t itemOffset) {
            return getType(readUshort(itemOffset));
        });
    }

    // --- Class Definitions ---

    FixedStrideList<ClassDef> DexFile::classes() const
    {
        const Impl::Table& table = m_impl->classDefs;
        return FixedStrideList<ClassDef>(table.size, table.offset, kClassDefSize,
                                         [this](uint32_t itemOffset) {
            return ClassDef(*this, itemOffset);
        });
    }

    std::optional<ClassDef> DexFile::findClass(std::string_view descriptor) const
    {
        const Impl::Table& table = m_impl->classDefs;
        for (uint32_t i = 0; i < table.size; ++i)
        {
            uint32_t itemOffset = table.offset + i * kClassDefSize;
            if (getType(readUint(itemOffset)) == descriptor)
            {
                return ClassDef(*this, itemOffset);
            }
        }
        return std::nullopt;
    }

    // --- Header Accessors ---

    uint32_t DexFile::version() const { return m_impl->version; }
    uint32_t DexFile::stringCount() const { return m_impl->stringIds.size; }
    uint32_t DexFile::typeCount() const { return m_impl->typeIds.size; }
    uint32_t DexFile::protoCount() const { return m_impl->protoIds.size; }
    uint32_t DexFile::fieldCount() const { return m_impl->fieldIds.size; }
    uint32_t DexFile::methodCount() const { return m_impl->methodIds.size; }
    uint32_t DexFile::classCount() const { return m_impl->classDefs.size; }

} // namespace dexview
