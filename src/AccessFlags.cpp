/**
 * @file AccessFlags.cpp
 * @brief Keyword formatting of access flags.
 */

#include "dexview/AccessFlags.hpp"
#include <array>

namespace dexview
{
    namespace
    {
        struct FlagName
        {
            uint32_t bit;
            const char* name;
            bool onClass;
            bool onField;
            bool onMethod;
        };

        constexpr std::array<FlagName, 19> kFlagNames = {{
            {ACC_PUBLIC,                "public",                true,  true,  true},
            {ACC_PRIVATE,               "private",               true,  true,  true},
            {ACC_PROTECTED,             "protected",             true,  true,  true},
            {ACC_STATIC,                "static",                true,  true,  true},
            {ACC_FINAL,                 "final",                 true,  true,  true},
            {ACC_SYNCHRONIZED,          "synchronized",          false, false, true},
            {ACC_VOLATILE,              "volatile",              false, true,  false},
            {ACC_BRIDGE,                "bridge",                false, false, true},
            {ACC_TRANSIENT,             "transient",             false, true,  false},
            {ACC_VARARGS,               "varargs",               false, false, true},
            {ACC_NATIVE,                "native",                false, false, true},
            {ACC_INTERFACE,             "interface",             true,  false, false},
            {ACC_ABSTRACT,              "abstract",              true,  false, true},
            {ACC_STRICT,                "strictfp",              false, false, true},
            {ACC_SYNTHETIC,             "synthetic",             true,  true,  true},
            {ACC_ANNOTATION,            "annotation",            true,  false, false},
            {ACC_ENUM,                  "enum",                  true,  true,  false},
            {ACC_CONSTRUCTOR,           "constructor",           false, false, true},
            {ACC_DECLARED_SYNCHRONIZED, "declared-synchronized", false, false, true},
        }};
    }

    std::string formatAccessFlags(uint32_t flags, FlagTarget target)
    {
        std::string result;
        for (const auto& flag : kFlagNames)
        {
            if ((flags & flag.bit) == 0) continue;

            bool applies = (target == FlagTarget::Class && flag.onClass) ||
                           (target == FlagTarget::Field && flag.onField) ||
                           (target == FlagTarget::Method && flag.onMethod);
            if (!applies) continue;

            if (!result.empty()) result += ' ';
            result += flag.name;
        }
        return result;
    }

} // namespace dexview
