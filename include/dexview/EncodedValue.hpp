/**
 * @file EncodedValue.hpp
 * @brief Location and shape of one encoded_value.
 *
 * An encoded value is a header byte (value type in the low five bits,
 * an argument in the high three) followed by a type-dependent payload.
 * Only what is needed to step over a value and to read scalar payloads
 * is decoded here; arrays and annotations are skipped, not interpreted.
 */

#pragma once

#include <cstdint>

namespace dexview
{
    class DexFile;
    class DexReader;

    /// Deepest nesting of arrays and annotations accepted inside one value.
    constexpr uint32_t kMaxEncodedValueDepth = 256;

    enum class ValueType : uint8_t
    {
        Byte         = 0x00,
        Short        = 0x02,
        Char         = 0x03,
        Int          = 0x04,
        Long         = 0x06,
        Float        = 0x10,
        Double       = 0x11,
        MethodType   = 0x15,
        MethodHandle = 0x16,
        String       = 0x17,
        Type         = 0x18,
        Field        = 0x19,
        Method       = 0x1a,
        Enum         = 0x1b,
        Array        = 0x1c,
        Annotation   = 0x1d,
        Null         = 0x1e,
        Boolean      = 0x1f
    };

    /**
     * @class EncodedValue
     * @brief A lazily read encoded_value.
     */
    class EncodedValue
    {
    public:
        /**
         * @brief Reads the header at the reader's position and steps over
         * the whole value, nested arrays and annotations included.
         * @param depth Nesting level of the value; 0 at the top.
         * @throws MalformedEncoding on an unknown type, an argument that
         * is illegal for the type, a truncated payload, or arrays and
         * annotations nested deeper than kMaxEncodedValueDepth.
         */
        static EncodedValue read(DexReader& reader, uint32_t depth = 0);

        ValueType type() const { return m_type; }

        /// @brief The three high bits of the header byte.
        uint8_t valueArg() const { return m_arg; }

        /// @brief Offset of the header byte.
        uint32_t offset() const { return m_offset; }

        bool isNull() const { return m_type == ValueType::Null; }

        /// @brief For Boolean values, the value itself; false otherwise.
        bool booleanValue() const { return m_type == ValueType::Boolean && m_arg != 0; }

        /**
         * @brief Normalized payload bits of a scalar value.
         *
         * Byte, Short, Int and Long are sign-extended; Float and Double
         * are shifted back into their high-order position so the result
         * is the IEEE bit pattern; Char and the index-carrying types are
         * zero-extended. Null and Boolean have no payload and yield the
         * boolean value. Arrays and annotations yield 0.
         */
        uint64_t bits() const;

        /**
         * @brief The bits of an Int, Short, Byte, Char or Long as a signed value.
         */
        int64_t asLong() const { return static_cast<int64_t>(bits()); }

    private:
        EncodedValue(const DexFile& file, uint32_t offset, ValueType type, uint8_t arg)
            : m_file(&file), m_offset(offset), m_type(type), m_arg(arg) {}

        const DexFile* m_file;
        uint32_t m_offset;
        ValueType m_type;
        uint8_t m_arg;
    };

    /**
     * @brief Steps a reader over one encoded_value.
     */
    void skipEncodedValue(DexReader& reader, uint32_t depth = 0);

    /**
     * @brief Steps a reader over an encoded_array (size, then values).
     * @param depth Nesting level of the array itself.
     * @return The number of values skipped.
     */
    uint32_t skipEncodedArray(DexReader& reader, uint32_t depth = 0);

    /**
     * @brief Steps a reader over an encoded_annotation (type, size, name/value pairs).
     */
    void skipEncodedAnnotation(DexReader& reader, uint32_t depth = 0);

} // namespace dexview
