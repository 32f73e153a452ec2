/**
 * @file MemberEntry.hpp
 * @brief Everything one step of a member stream yields.
 */

#pragma once

#include "EncodedValue.hpp"
#include <cstdint>
#include <optional>

namespace dexview
{
    /**
     * @struct MemberEntry
     * @brief A decoded encoded_field or encoded_method plus its side channels.
     */
    struct MemberEntry
    {
        uint32_t index = 0;                      ///< Ordinal in the global field/method table.
        uint32_t accessFlags = 0;
        uint32_t codeOffset = 0;                 ///< Methods only; 0 for abstract and native.
        uint32_t annotationsOffset = 0;          ///< annotation_set_item, 0 if none.
        uint32_t parameterAnnotationsOffset = 0; ///< annotation_set_ref_list, methods only.
        std::optional<EncodedValue> initialValue; ///< Static fields with an explicit value.
    };

} // namespace dexview
