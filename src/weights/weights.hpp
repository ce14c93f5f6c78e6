#ifndef TETHER_WEIGHTS_HPP
#define TETHER_WEIGHTS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/table.hpp"

namespace Tether::Weights {
    using Entry = Details::Entry;
    using Entries = Details::Entries;
    using Table = Details::Table;

    inline constexpr double kSumTolerance = Details::kSumTolerance;

    using Details::normalize;
    using Details::uniform;
}

#endif // TETHER_WEIGHTS_HPP
