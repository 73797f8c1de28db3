#pragma once
#include "core/Category.hpp"
#include "core/Error.hpp"
#include "core/Period.hpp"

#include <array>
#include <cstddef>
#include <limits>
#include <string>

namespace PT {

struct TreeJsonOptions {
    static constexpr std::size_t kUnlimitedDepth = std::numeric_limits<std::size_t>::max();

    // Keys of the "indices" object, oldest period first.
    std::array<std::string, kPeriodCount> periodKeys{"n-12", "n-3", "n-2", "n-1", "n"};
    std::size_t                           maxDepth        = kUnlimitedDepth;
    int                                   dumpIndent      = 2; // -1 for compact
    bool                                  includeMetadata = false;
};

class TreeJsonExporter {
public:
    // Fails with MalformedInput when a name or label is not valid UTF-8.
    static auto Export(CategoryTree const& tree, TreeJsonOptions const& options = TreeJsonOptions{})
            -> Expected<std::string>;
};

} // namespace PT
