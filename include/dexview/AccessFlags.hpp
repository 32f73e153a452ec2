/**
 * @file AccessFlags.hpp
 * @brief Access flag bits of classes, fields and methods.
 *
 * Several bits are shared: 0x40 is volatile on a field and bridge on a
 * method, 0x80 is transient on a field and varargs on a method.
 */

#pragma once

#include <cstdint>
#include <string>

namespace dexview
{
    constexpr uint32_t ACC_PUBLIC                = 0x00001;
    constexpr uint32_t ACC_PRIVATE               = 0x00002;
    constexpr uint32_t ACC_PROTECTED             = 0x00004;
    constexpr uint32_t ACC_STATIC                = 0x00008;
    constexpr uint32_t ACC_FINAL                 = 0x00010;
    constexpr uint32_t ACC_SYNCHRONIZED          = 0x00020; // method
    constexpr uint32_t ACC_VOLATILE              = 0x00040; // field
    constexpr uint32_t ACC_BRIDGE                = 0x00040; // method
    constexpr uint32_t ACC_TRANSIENT             = 0x00080; // field
    constexpr uint32_t ACC_VARARGS               = 0x00080; // method
    constexpr uint32_t ACC_NATIVE                = 0x00100;
    constexpr uint32_t ACC_INTERFACE             = 0x00200;
    constexpr uint32_t ACC_ABSTRACT              = 0x00400;
    constexpr uint32_t ACC_STRICT                = 0x00800;
    constexpr uint32_t ACC_SYNTHETIC             = 0x01000;
    constexpr uint32_t ACC_ANNOTATION            = 0x02000;
    constexpr uint32_t ACC_ENUM                  = 0x04000;
    constexpr uint32_t ACC_CONSTRUCTOR           = 0x10000;
    constexpr uint32_t ACC_DECLARED_SYNCHRONIZED = 0x20000;

    /// @brief What a set of flags belongs to; decides shared bits.
    enum class FlagTarget
    {
        Class,
        Field,
        Method
    };

    /**
     * @brief Formats flags as space-separated Java keywords, e.g.
     * "public static final". Bits that mean nothing for @p target are
     * left out.
     */
    std::string formatAccessFlags(uint32_t flags, FlagTarget target);

} // namespace dexview
