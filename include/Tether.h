#ifndef TETHER_LIBRARY_H
#define TETHER_LIBRARY_H

#include "../src/common/errors.hpp"
#include "../src/weights/weights.hpp"
#include "../src/priority/priority.hpp"
#include "../src/semantic/semantic.hpp"
#include "../src/loss/loss.hpp"
#include "../src/variant/variant.hpp"



// Public umbrella header.
// -----------------------------------------------------------------------------
// Intention:
//  - Re-export the attribute alignment loss and everything needed to drive it
//    (weight tables, trainable priorities, the semantic model seam, variants).
//  - Include-only components; implementation lives in header-only modules under
//    src/, each module header re-exporting its details/ folder.
//  - Link against LibTorch only; the embedding model behind the semantic penalty
//    is supplied by the caller through Tether::Semantic::Model.

#endif // TETHER_LIBRARY_H
