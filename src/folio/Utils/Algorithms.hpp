#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <optional>

namespace folio
{
    template<typename Container, typename UnaryPredicate>
    auto FindIf(Container const& c, UnaryPredicate p)
    {
        using std::begin;
        using std::end;

        return std::find_if(begin(c), end(c), p);
    }

    template<typename Container, typename UnaryPredicate>
    bool ContainsIf(Container const& c, UnaryPredicate p)
    {
        using std::end;

        return FindIf(c, p) != end(c);
    }

    // returns the index of the first element that matches the predicate, or `std::nullopt`
    template<typename Container, typename UnaryPredicate>
    std::optional<std::size_t> IndexOfIf(Container const& c, UnaryPredicate p)
    {
        using std::begin;
        using std::end;

        auto const it = FindIf(c, p);
        if (it == end(c))
        {
            return std::nullopt;
        }
        return static_cast<std::size_t>(std::distance(begin(c), it));
    }
}
