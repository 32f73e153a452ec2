/**
 * @file DexImageBuilder.hpp
 * @brief Builds small, valid dex images in memory for the tests.
 *
 * The id tables sit at fixed positions with fixed capacities and the
 * data section starts at kDataStart, so every data item gets its final
 * offset as soon as it is added. Indices are handed out in insertion
 * order; add filler entries to place an item at a specific index.
 */

#pragma once

#include "dexview/DexFile.hpp"
#include <cstdint>
#include <algorithm>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace dexview::test
{
    class DexImageBuilder
    {
    public:
        static constexpr uint32_t kStringIdsOffset = 0x070;
        static constexpr uint32_t kMaxStrings = 128;
        static constexpr uint32_t kTypeIdsOffset = 0x270;
        static constexpr uint32_t kMaxTypes = 64;
        static constexpr uint32_t kProtoIdsOffset = 0x370;
        static constexpr uint32_t kMaxProtos = 16;
        static constexpr uint32_t kFieldIdsOffset = 0x430;
        static constexpr uint32_t kMaxFields = 64;
        static constexpr uint32_t kMethodIdsOffset = 0x630;
        static constexpr uint32_t kMaxMethods = 64;
        static constexpr uint32_t kClassDefsOffset = 0x830;
        static constexpr uint32_t kMaxClassDefs = 8;
        static constexpr uint32_t kDataStart = 0x1000;

        struct MemberSpec
        {
            uint32_t index;
            uint32_t accessFlags;
            uint32_t codeOffset = 0;
        };

        struct ClassDataSpec
        {
            std::vector<MemberSpec> staticFields;
            std::vector<MemberSpec> instanceFields;
            std::vector<MemberSpec> directMethods;
            std::vector<MemberSpec> virtualMethods;
        };

        struct ClassDefSpec
        {
            uint32_t classIndex = 0;
            uint32_t accessFlags = 0;
            uint32_t superclassIndex = NO_INDEX;
            uint32_t interfacesOffset = 0;
            uint32_t sourceFileIndex = NO_INDEX;
            uint32_t annotationsOffset = 0;
            uint32_t classDataOffset = 0;
            uint32_t staticValuesOffset = 0;
        };

        /// (member ordinal, item offset)
        using MemberAnnotation = std::pair<uint32_t, uint32_t>;

        // --- Encoding helpers ---

        static void writeUleb128(std::vector<uint8_t>& out, uint32_t value)
        {
            do
            {
                uint8_t byte = value & 0x7f;
                value >>= 7;
                if (value != 0) byte |= 0x80;
                out.push_back(byte);
            } while (value != 0);
        }

        static std::vector<uint8_t> uleb128(uint32_t value)
        {
            std::vector<uint8_t> out;
            writeUleb128(out, value);
            return out;
        }

        static void putUint(std::vector<uint8_t>& out, uint32_t offset, uint32_t value)
        {
            for (int i = 0; i < 4; ++i)
            {
                out[offset + i] = static_cast<uint8_t>(value >> (8 * i));
            }
        }

        static void putUshort(std::vector<uint8_t>& out, uint32_t offset, uint16_t value)
        {
            out[offset] = static_cast<uint8_t>(value);
            out[offset + 1] = static_cast<uint8_t>(value >> 8);
        }

        /// encoded_value of type INT with a full 4-byte payload.
        static std::vector<uint8_t> encodedInt(int32_t value)
        {
            std::vector<uint8_t> out = {static_cast<uint8_t>((3 << 5) | 0x04)};
            for (int i = 0; i < 4; ++i)
            {
                out.push_back(static_cast<uint8_t>(static_cast<uint32_t>(value) >> (8 * i)));
            }
            return out;
        }

        /// encoded_value of type LONG with a full 8-byte payload.
        static std::vector<uint8_t> encodedLong(int64_t value)
        {
            std::vector<uint8_t> out = {static_cast<uint8_t>((7 << 5) | 0x06)};
            for (int i = 0; i < 8; ++i)
            {
                out.push_back(static_cast<uint8_t>(static_cast<uint64_t>(value) >> (8 * i)));
            }
            return out;
        }

        static std::vector<uint8_t> encodedString(uint32_t stringIndex)
        {
            std::vector<uint8_t> out = {static_cast<uint8_t>((3 << 5) | 0x17)};
            for (int i = 0; i < 4; ++i)
            {
                out.push_back(static_cast<uint8_t>(stringIndex >> (8 * i)));
            }
            return out;
        }

        static std::vector<uint8_t> encodedBoolean(bool value)
        {
            return {static_cast<uint8_t>(((value ? 1 : 0) << 5) | 0x1f)};
        }

        static std::vector<uint8_t> encodedNull()
        {
            return {0x1e};
        }

        // --- Id tables ---

        uint32_t addString(const std::string& text)
        {
            auto it = m_stringIndices.find(text);
            if (it != m_stringIndices.end()) return it->second;

            std::vector<uint8_t> bytes(text.begin(), text.end());
            uint32_t utf16Length = 0;
            for (unsigned char c : text)
            {
                if ((c & 0xc0) != 0x80) ++utf16Length;
            }
            uint32_t index = addRawString(bytes, utf16Length);
            m_stringIndices.emplace(text, index);
            return index;
        }

        /**
         * @brief Adds string data verbatim (modified UTF-8, no terminator).
         */
        uint32_t addRawString(const std::vector<uint8_t>& mutf8, uint32_t utf16Length)
        {
            if (m_stringDataOffsets.size() >= kMaxStrings) throw std::length_error("too many strings");

            std::vector<uint8_t> item = uleb128(utf16Length);
            item.insert(item.end(), mutf8.begin(), mutf8.end());
            item.push_back(0);
            m_stringDataOffsets.push_back(appendData(item));
            return static_cast<uint32_t>(m_stringDataOffsets.size() - 1);
        }

        uint32_t addType(const std::string& descriptor)
        {
            auto it = m_typeIndices.find(descriptor);
            if (it != m_typeIndices.end()) return it->second;
            if (m_typeStringIndices.size() >= kMaxTypes) throw std::length_error("too many types");

            m_typeStringIndices.push_back(addString(descriptor));
            uint32_t index = static_cast<uint32_t>(m_typeStringIndices.size() - 1);
            m_typeIndices.emplace(descriptor, index);
            return index;
        }

        uint32_t addProto(const std::string& returnType, const std::vector<std::string>& parameters)
        {
            if (m_protos.size() >= kMaxProtos) throw std::length_error("too many protos");

            std::string shorty(1, shortyChar(returnType));
            std::vector<uint32_t> parameterTypes;
            for (const auto& parameter : parameters)
            {
                shorty += shortyChar(parameter);
                parameterTypes.push_back(addType(parameter));
            }

            ProtoId proto{};
            proto.shortyIndex = addString(shorty);
            proto.returnTypeIndex = addType(returnType);
            proto.parametersOffset = parameters.empty() ? 0 : addTypeList(parameterTypes);
            m_protos.push_back(proto);
            return static_cast<uint32_t>(m_protos.size() - 1);
        }

        uint32_t addField(const std::string& definingClass, const std::string& type,
                          const std::string& name)
        {
            if (m_fields.size() >= kMaxFields) throw std::length_error("too many fields");

            FieldId field{};
            field.classIndex = static_cast<uint16_t>(addType(definingClass));
            field.typeIndex = static_cast<uint16_t>(addType(type));
            field.nameIndex = addString(name);
            m_fields.push_back(field);
            return static_cast<uint32_t>(m_fields.size() - 1);
        }

        uint32_t addMethod(const std::string& definingClass, const std::string& returnType,
                           const std::vector<std::string>& parameters, const std::string& name)
        {
            if (m_methods.size() >= kMaxMethods) throw std::length_error("too many methods");

            MethodId method{};
            method.classIndex = static_cast<uint16_t>(addType(definingClass));
            method.protoIndex = static_cast<uint16_t>(addProto(returnType, parameters));
            method.nameIndex = addString(name);
            m_methods.push_back(method);
            return static_cast<uint32_t>(m_methods.size() - 1);
        }

        // --- Data items ---

        /**
         * @brief Appends raw bytes to the data section.
         * @return The absolute offset of the first byte.
         */
        uint32_t appendData(const std::vector<uint8_t>& bytes, uint32_t alignment = 1)
        {
            while ((kDataStart + m_data.size()) % alignment != 0)
            {
                m_data.push_back(0);
            }
            uint32_t offset = kDataStart + static_cast<uint32_t>(m_data.size());
            m_data.insert(m_data.end(), bytes.begin(), bytes.end());
            return offset;
        }

        uint32_t addTypeList(const std::vector<uint32_t>& typeIndices)
        {
            std::vector<uint8_t> item(4 + 2 * typeIndices.size());
            putUint(item, 0, static_cast<uint32_t>(typeIndices.size()));
            for (size_t i = 0; i < typeIndices.size(); ++i)
            {
                putUshort(item, static_cast<uint32_t>(4 + 2 * i), static_cast<uint16_t>(typeIndices[i]));
            }
            return appendData(item, 4);
        }

        /**
         * @brief Adds an annotation_item with the given (name, value) elements.
         */
        uint32_t addAnnotation(uint8_t visibility, uint32_t typeIndex,
                               const std::vector<std::pair<uint32_t, std::vector<uint8_t>>>& elements = {})
        {
            std::vector<uint8_t> item = {visibility};
            writeUleb128(item, typeIndex);
            writeUleb128(item, static_cast<uint32_t>(elements.size()));
            for (const auto& [nameIndex, value] : elements)
            {
                writeUleb128(item, nameIndex);
                item.insert(item.end(), value.begin(), value.end());
            }
            return appendData(item);
        }

        uint32_t addAnnotationSet(const std::vector<uint32_t>& annotationOffsets)
        {
            return addOffsetList(annotationOffsets);
        }

        uint32_t addAnnotationSetRefList(const std::vector<uint32_t>& setOffsets)
        {
            return addOffsetList(setOffsets);
        }

        uint32_t addAnnotationsDirectory(uint32_t classAnnotationsOffset,
                                         const std::vector<MemberAnnotation>& fields,
                                         const std::vector<MemberAnnotation>& methods = {},
                                         const std::vector<MemberAnnotation>& parameters = {})
        {
            size_t pairs = fields.size() + methods.size() + parameters.size();
            std::vector<uint8_t> item(16 + 8 * pairs);
            putUint(item, 0, classAnnotationsOffset);
            putUint(item, 4, static_cast<uint32_t>(fields.size()));
            putUint(item, 8, static_cast<uint32_t>(methods.size()));
            putUint(item, 12, static_cast<uint32_t>(parameters.size()));

            uint32_t o = 16;
            for (const auto* table : {&fields, &methods, &parameters})
            {
                for (const auto& [index, offset] : *table)
                {
                    putUint(item, o, index);
                    putUint(item, o + 4, offset);
                    o += 8;
                }
            }
            return appendData(item, 4);
        }

        uint32_t addEncodedArray(const std::vector<std::vector<uint8_t>>& values)
        {
            std::vector<uint8_t> item = uleb128(static_cast<uint32_t>(values.size()));
            for (const auto& value : values)
            {
                item.insert(item.end(), value.begin(), value.end());
            }
            return appendData(item);
        }

        /**
         * @brief Encodes a class_data_item. Each run must be sorted by index.
         */
        static std::vector<uint8_t> encodeClassData(const ClassDataSpec& spec)
        {
            std::vector<uint8_t> item;
            writeUleb128(item, static_cast<uint32_t>(spec.staticFields.size()));
            writeUleb128(item, static_cast<uint32_t>(spec.instanceFields.size()));
            writeUleb128(item, static_cast<uint32_t>(spec.directMethods.size()));
            writeUleb128(item, static_cast<uint32_t>(spec.virtualMethods.size()));

            auto writeRun = [&](const std::vector<MemberSpec>& run, bool methods) {
                uint32_t previous = 0;
                for (const auto& member : run)
                {
                    writeUleb128(item, member.index - previous);
                    writeUleb128(item, member.accessFlags);
                    if (methods) writeUleb128(item, member.codeOffset);
                    previous = member.index;
                }
            };
            writeRun(spec.staticFields, false);
            writeRun(spec.instanceFields, false);
            writeRun(spec.directMethods, true);
            writeRun(spec.virtualMethods, true);
            return item;
        }

        uint32_t addClassData(const ClassDataSpec& spec)
        {
            return appendData(encodeClassData(spec));
        }

        uint32_t addClassDef(const ClassDefSpec& spec)
        {
            if (m_classDefs.size() >= kMaxClassDefs) throw std::length_error("too many classes");

            m_classDefs.push_back(spec);
            return kClassDefsOffset + static_cast<uint32_t>(m_classDefs.size() - 1) * kClassDefSize;
        }

        // --- Output ---

        std::vector<uint8_t> build() const
        {
            std::vector<uint8_t> image(kDataStart + m_data.size(), 0);

            const char magic[8] = {'d', 'e', 'x', '\n', '0', '3', '5', '\0'};
            for (int i = 0; i < 8; ++i) image[i] = static_cast<uint8_t>(magic[i]);

            putUint(image, 32, static_cast<uint32_t>(image.size()));
            putUint(image, 36, kHeaderSize);
            putUint(image, 40, 0x12345678);
            putUint(image, 56, static_cast<uint32_t>(m_stringDataOffsets.size()));
            putUint(image, 60, kStringIdsOffset);
            putUint(image, 64, static_cast<uint32_t>(m_typeStringIndices.size()));
            putUint(image, 68, kTypeIdsOffset);
            putUint(image, 72, static_cast<uint32_t>(m_protos.size()));
            putUint(image, 76, kProtoIdsOffset);
            putUint(image, 80, static_cast<uint32_t>(m_fields.size()));
            putUint(image, 84, kFieldIdsOffset);
            putUint(image, 88, static_cast<uint32_t>(m_methods.size()));
            putUint(image, 92, kMethodIdsOffset);
            putUint(image, 96, static_cast<uint32_t>(m_classDefs.size()));
            putUint(image, 100, kClassDefsOffset);
            putUint(image, 104, static_cast<uint32_t>(m_data.size()));
            putUint(image, 108, kDataStart);

            for (size_t i = 0; i < m_stringDataOffsets.size(); ++i)
            {
                putUint(image, static_cast<uint32_t>(kStringIdsOffset + 4 * i), m_stringDataOffsets[i]);
            }
            for (size_t i = 0; i < m_typeStringIndices.size(); ++i)
            {
                putUint(image, static_cast<uint32_t>(kTypeIdsOffset + 4 * i), m_typeStringIndices[i]);
            }
            for (size_t i = 0; i < m_protos.size(); ++i)
            {
                uint32_t o = static_cast<uint32_t>(kProtoIdsOffset + 12 * i);
                putUint(image, o, m_protos[i].shortyIndex);
                putUint(image, o + 4, m_protos[i].returnTypeIndex);
                putUint(image, o + 8, m_protos[i].parametersOffset);
            }
            for (size_t i = 0; i < m_fields.size(); ++i)
            {
                uint32_t o = static_cast<uint32_t>(kFieldIdsOffset + 8 * i);
                putUshort(image, o, m_fields[i].classIndex);
                putUshort(image, o + 2, m_fields[i].typeIndex);
                putUint(image, o + 4, m_fields[i].nameIndex);
            }
            for (size_t i = 0; i < m_methods.size(); ++i)
            {
                uint32_t o = static_cast<uint32_t>(kMethodIdsOffset + 8 * i);
                putUshort(image, o, m_methods[i].classIndex);
                putUshort(image, o + 2, m_methods[i].protoIndex);
                putUint(image, o + 4, m_methods[i].nameIndex);
            }
            for (size_t i = 0; i < m_classDefs.size(); ++i)
            {
                const ClassDefSpec& spec = m_classDefs[i];
                uint32_t o = static_cast<uint32_t>(kClassDefsOffset + kClassDefSize * i);
                putUint(image, o, spec.classIndex);
                putUint(image, o + 4, spec.accessFlags);
                putUint(image, o + 8, spec.superclassIndex);
                putUint(image, o + 12, spec.interfacesOffset);
                putUint(image, o + 16, spec.sourceFileIndex);
                putUint(image, o + 20, spec.annotationsOffset);
                putUint(image, o + 24, spec.classDataOffset);
                putUint(image, o + 28, spec.staticValuesOffset);
            }

            std::copy(m_data.begin(), m_data.end(), image.begin() + kDataStart);
            return image;
        }

    private:
        static char shortyChar(const std::string& descriptor)
        {
            return (descriptor[0] == '[') ? 'L' : descriptor[0];
        }

        uint32_t addOffsetList(const std::vector<uint32_t>& offsets)
        {
            std::vector<uint8_t> item(4 + 4 * offsets.size());
            putUint(item, 0, static_cast<uint32_t>(offsets.size()));
            for (size_t i = 0; i < offsets.size(); ++i)
            {
                putUint(item, static_cast<uint32_t>(4 + 4 * i), offsets[i]);
            }
            return appendData(item, 4);
        }

        std::vector<uint8_t> m_data;
        std::vector<uint32_t> m_stringDataOffsets;
        std::map<std::string, uint32_t> m_stringIndices;
        std::vector<uint32_t> m_typeStringIndices;
        std::map<std::string, uint32_t> m_typeIndices;
        std::vector<ProtoId> m_protos;
        std::vector<FieldId> m_fields;
        std::vector<MethodId> m_methods;
        std::vector<ClassDefSpec> m_classDefs;
    };

} // namespace dexview::test
