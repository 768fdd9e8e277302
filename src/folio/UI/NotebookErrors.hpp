#pragma once

#include <stdexcept>

namespace folio
{
    // thrown when a tab lookup (by identifier, content, name, or header) doesn't
    // match any page of a notebook
    class TabNotFoundError final : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // thrown when a numeric tab index is outside of the valid range
    class TabIndexError final : public std::out_of_range {
    public:
        using std::out_of_range::out_of_range;
    };
}
