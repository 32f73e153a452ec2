/**
 * @file DexFile.hpp
 * @brief The container: owns (or borrows) the buffer and its id tables.
 *
 * DexFile is the primitive reader every view is built on. It validates
 * the fixed header once, then offers bounds-checked fixed-width reads,
 * ULEB128 decoding and lookups into the global string, type, proto,
 * field and method tables. All views hold a pointer to the DexFile and
 * byte offsets into its buffer, so the DexFile must outlive them; it is
 * neither copyable nor movable.
 */

#pragma once

#include "FixedStrideList.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace dexview
{
    class ClassDef;

    /// Table index meaning "no entry".
    constexpr uint32_t NO_INDEX = 0xffffffff;

    /// Size of the fixed container header.
    constexpr uint32_t kHeaderSize = 0x70;

    /// Width of one class_def_item.
    constexpr uint32_t kClassDefSize = 32;

    /// @brief An entry of the field id table.
    struct FieldId
    {
        uint16_t classIndex;
        uint16_t typeIndex;
        uint32_t nameIndex;
    };

    /// @brief An entry of the method id table.
    struct MethodId
    {
        uint16_t classIndex;
        uint16_t protoIndex;
        uint32_t nameIndex;
    };

    /// @brief An entry of the prototype id table.
    struct ProtoId
    {
        uint32_t shortyIndex;
        uint32_t returnTypeIndex;
        uint32_t parametersOffset;
    };

    /**
     * @class DexFile
     * @brief Read-only access to one container buffer.
     */
    class DexFile
    {
    public:
        /**
         * @brief Loads a container from disk into an owned buffer.
         * @param filepath Path to the .dex file.
         * @throws std::runtime_error if the file cannot be read.
         * @throws MalformedEncoding, InconsistentHeader if the header is invalid.
         */
        explicit DexFile(const std::string& filepath);

        /**
         * @brief Views a container held in memory by the caller.
         *
         * The bytes are not copied and must stay alive and unmodified
         * for the lifetime of this DexFile and every view built from it.
         *
         * @param data The container bytes.
         * @throws MalformedEncoding, InconsistentHeader if the header is invalid.
         */
        explicit DexFile(std::span<const uint8_t> data);

        ~DexFile();

        DexFile(const DexFile&) = delete;
        DexFile& operator=(const DexFile&) = delete;

        // --- Primitive Reads ---

        /// @brief Size of the buffer in bytes.
        size_t size() const;

        uint8_t readUbyte(uint32_t offset) const;
        uint16_t readUshort(uint32_t offset) const;
        uint32_t readUint(uint32_t offset) const;

        /**
         * @brief Reads a little-endian unsigned value of 1 to 8 bytes.
         */
        uint64_t readUnsigned(uint32_t offset, size_t width) const;

        /**
         * @brief Decodes a ULEB128 value.
         * @param offset Offset of the first byte.
         * @param value Receives the value.
         * @return The number of bytes consumed.
         * @throws MalformedEncoding if the encoding is invalid or truncated.
         */
        uint32_t readUleb128(uint32_t offset, uint32_t& value) const;

        /**
         * @brief Checks that @p length bytes starting at @p offset exist.
         * @throws MalformedEncoding otherwise.
         */
        void checkRange(uint32_t offset, uint64_t length) const;

        // --- Table Lookups ---

        /**
         * @brief Resolves a string id to its decoded UTF-8 text.
         * @throws IndexOutOfRange if index >= stringCount().
         */
        std::string getString(uint32_t index) const;

        /**
         * @brief Like getString(), but NO_INDEX yields an empty optional.
         */
        std::optional<std::string> getOptionalString(uint32_t index) const;

        /**
         * @brief Resolves a type id to its descriptor (e.g. "Ljava/lang/Object;").
         * @throws IndexOutOfRange if index >= typeCount().
         */
        std::string getType(uint32_t index) const;

        /**
         * @brief Like getType(), but NO_INDEX yields an empty optional.
         */
        std::optional<std::string> getOptionalType(uint32_t index) const;

        FieldId fieldId(uint32_t index) const;
        MethodId methodId(uint32_t index) const;
        ProtoId protoId(uint32_t index) const;

        /**
         * @brief Views a type_list (4-byte size, then 2-byte type ids).
         * @param offset Offset of the list, 0 for the empty list.
         */
        FixedStrideList<std::string> typeList(uint32_t offset) const;

        // --- Class Definitions ---

        /**
         * @brief Views the class definition table.
         */
        FixedStrideList<ClassDef> classes() const;

        /**
         * @brief Finds a class by descriptor with a linear scan.
         * @return The class, or an empty optional if it is not defined here.
         */
        std::optional<ClassDef> findClass(std::string_view descriptor) const;

        // --- Header Accessors ---

        /// @brief The format version from the magic, e.g. 35.
        uint32_t version() const;

        uint32_t stringCount() const;
        uint32_t typeCount() const;
        uint32_t protoCount() const;
        uint32_t fieldCount() const;
        uint32_t methodCount() const;
        uint32_t classCount() const;

    private:
        /**
         * @struct Impl
         * @brief Private implementation (PIMPL) idiom.
         */
        struct Impl;
        std::unique_ptr<Impl> m_impl;
    };

} // namespace dexview
