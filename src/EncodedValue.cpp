/**
 * @file EncodedValue.cpp
 * @brief Implementation of encoded_value stepping and payload reads.
 */

#include "dexview/EncodedValue.hpp"
#include "dexview/DexReader.hpp"
#include "dexview/Exceptions.hpp"
#include <string>

namespace dexview
{
    namespace
    {
        /// Largest legal value_arg for each value type, or -1 if unknown.
        int maxValueArg(ValueType type)
        {
            switch (type)
            {
                case ValueType::Byte:         return 0;
                case ValueType::Short:
                case ValueType::Char:         return 1;
                case ValueType::Int:
                case ValueType::Float:
                case ValueType::MethodType:
                case ValueType::MethodHandle:
                case ValueType::String:
                case ValueType::Type:
                case ValueType::Field:
                case ValueType::Method:
                case ValueType::Enum:         return 3;
                case ValueType::Long:
                case ValueType::Double:       return 7;
                case ValueType::Array:
                case ValueType::Annotation:
                case ValueType::Null:         return 0;
                case ValueType::Boolean:      return 1;
            }
            return -1;
        }

        bool hasPayload(ValueType type)
        {
            return type != ValueType::Array &&
                   type != ValueType::Annotation &&
                   type != ValueType::Null &&
                   type != ValueType::Boolean;
        }
    }

    EncodedValue EncodedValue::read(DexReader& reader, uint32_t depth)
    {
        uint32_t offset = reader.offset();
        if (depth > kMaxEncodedValueDepth)
        {
            throw MalformedEncoding(
                "Encoded value at offset " + std::to_string(offset) +
                " is nested deeper than " + std::to_string(kMaxEncodedValueDepth)
            );
        }

        uint8_t header = reader.readUbyte();
        ValueType type = static_cast<ValueType>(header & 0x1f);
        uint8_t arg = static_cast<uint8_t>(header >> 5);

        int maxArg = maxValueArg(type);
        if (maxArg < 0)
        {
            throw MalformedEncoding(
                "Unknown encoded value type " + std::to_string(header & 0x1f) +
                " at offset " + std::to_string(offset)
            );
        }
        if (arg > maxArg)
        {
            throw MalformedEncoding(
                "Invalid value argument " + std::to_string(arg) +
                " for encoded value type " + std::to_string(header & 0x1f) +
                " at offset " + std::to_string(offset)
            );
        }

        if (type == ValueType::Array)
        {
            skipEncodedArray(reader, depth);
        }
        else if (type == ValueType::Annotation)
        {
            skipEncodedAnnotation(reader, depth);
        }
        else if (hasPayload(type))
        {
            reader.skip(arg + 1u);
        }

        return EncodedValue(reader.file(), offset, type, arg);
    }

    uint64_t EncodedValue::bits() const
    {
        if (m_type == ValueType::Null || m_type == ValueType::Boolean)
        {
            return booleanValue() ? 1 : 0;
        }
        if (!hasPayload(m_type))
        {
            return 0;
        }

        size_t width = m_arg + 1u;
        uint64_t raw = m_file->readUnsigned(m_offset + 1, width);
        unsigned unusedBits = static_cast<unsigned>(64 - 8 * width);

        switch (m_type)
        {
            case ValueType::Byte:
            case ValueType::Short:
            case ValueType::Int:
            case ValueType::Long:
                // Sign-extend from the top payload bit.
                return static_cast<uint64_t>(static_cast<int64_t>(raw << unusedBits) >> unusedBits);
            case ValueType::Float:
                return raw << (8 * (4 - width));
            case ValueType::Double:
                return raw << unusedBits;
            default:
                return raw;
        }
    }

    void skipEncodedValue(DexReader& reader, uint32_t depth)
    {
        [[maybe_unused]] EncodedValue value = EncodedValue::read(reader, depth);
    }

    uint32_t skipEncodedArray(DexReader& reader, uint32_t depth)
    {
        uint32_t size = reader.readUleb128();
        for (uint32_t i = 0; i < size; ++i)
        {
            skipEncodedValue(reader, depth + 1);
        }
        return size;
    }

    void skipEncodedAnnotation(DexReader& reader, uint32_t depth)
    {
        reader.skipUleb128(); // type_idx
        uint32_t size = reader.readUleb128();
        for (uint32_t i = 0; i < size; ++i)
        {
            reader.skipUleb128(); // name_idx
            skipEncodedValue(reader, depth + 1);
        }
    }

} // namespace dexview
