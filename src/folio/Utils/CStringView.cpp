#include "CStringView.hpp"

#include <ostream>
#include <string_view>

std::ostream& folio::operator<<(std::ostream& o, CStringView const& sv)
{
    return o << std::string_view{sv};
}
