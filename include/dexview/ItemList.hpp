/**
 * @file ItemList.hpp
 * @brief Common interface of the lazy list views.
 *
 * Every list handed out by the views (fixed-stride tables and
 * delta-encoded member streams) implements this interface. Elements are
 * produced on demand from the container buffer and returned by value;
 * nothing is cached between calls.
 */

#pragma once

#include <cstddef>
#include <functional>
#include <vector>

namespace dexview
{
    template <typename T>
    class ItemList
    {
    public:
        using value_type = T;

        virtual ~ItemList() = default;

        virtual size_t size() const = 0;

        /**
         * @brief Produces the element at @p index.
         * @throws IndexOutOfRange if index >= size().
         */
        virtual T at(size_t index) const = 0;

        /**
         * @brief Visits every element in order.
         *
         * The default visits by index. Lists without random access
         * override this with a single forward traversal.
         */
        virtual void forEach(const std::function<void(const T&)>& visitor) const
        {
            for (size_t i = 0; i < size(); ++i)
            {
                visitor(at(i));
            }
        }

        bool empty() const { return size() == 0; }

        /**
         * @brief Materializes the whole list.
         */
        std::vector<T> toVector() const
        {
            std::vector<T> result;
            result.reserve(size());
            forEach([&](const T& item) { result.push_back(item); });
            return result;
        }
    };

} // namespace dexview
