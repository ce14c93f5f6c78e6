#ifndef TETHER_PRIORITY_HPP
#define TETHER_PRIORITY_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/store.hpp"

namespace Tether::Priority {
    using PriorityStoreImpl = Details::PriorityStoreImpl;
    using PriorityStore = Details::PriorityStore;

    [[nodiscard]] inline PriorityStore Store(const Weights::Table& table) {
        return PriorityStore(table);
    }
}

#endif // TETHER_PRIORITY_HPP
