/**
 * @file Exceptions.hpp
 * @brief Exception types raised while reading a dex container.
 *
 * Every reader failure propagates as one of these, unchanged, through
 * every list and iterator layer. A record that raised is unusable.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace dexview
{
    /**
     * @class DexFormatError
     * @brief Base class for errors caused by the container's bytes.
     */
    class DexFormatError : public std::runtime_error
    {
    public:
        explicit DexFormatError(const std::string& what)
            : std::runtime_error(what) {}
    };

    /**
     * @class MalformedEncoding
     * @brief A read runs past the buffer, or an encoding is invalid.
     *
     * Raised for truncated fixed-width reads, ULEB128 values that do not
     * terminate (or exceed 32 bits), tables whose declared count would
     * read past the end, and invalid encoded values.
     */
    class MalformedEncoding : public DexFormatError
    {
    public:
        explicit MalformedEncoding(const std::string& what)
            : DexFormatError(what) {}
    };

    /**
     * @class InconsistentHeader
     * @brief Declared sizes disagree with each other or with the buffer.
     */
    class InconsistentHeader : public DexFormatError
    {
    public:
        explicit InconsistentHeader(const std::string& what)
            : DexFormatError(what) {}
    };

    /**
     * @class IndexOutOfRange
     * @brief An element or table index at or past the reported size.
     */
    class IndexOutOfRange : public std::out_of_range
    {
    public:
        IndexOutOfRange(const std::string& what, size_t index, size_t size)
            : std::out_of_range(what + ": index " + std::to_string(index) +
                                " is out of range for size " + std::to_string(size)) {}
    };

} // namespace dexview
