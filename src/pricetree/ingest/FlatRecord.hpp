#pragma once
#include "core/Period.hpp"

#include <array>
#include <string>

namespace PT {

// One row of the source table, still as text. Numeric fields are parsed by
// the tree builder, which never rejects a row for a bad number.
struct FlatRecord {
    std::string                           code;
    std::string                           name;
    std::string                           weight;
    std::array<std::string, kPeriodCount> indices; // oldest (n-12) first
};

} // namespace PT
