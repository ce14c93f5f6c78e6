#ifndef TETHER_LOSS_TARGETS_HPP
#define TETHER_LOSS_TARGETS_HPP

#include <optional>
#include <string>
#include <vector>

#include <torch/torch.h>

namespace Tether::Loss::Details {

    // vector: [D] broadcast over the batch, or [B, D] one row per sample.
    struct AttributeTarget {
        std::string name{};
        torch::Tensor vector{};
    };

    // Built per example by the caller and not retained past one forward call.
    struct TargetsBundle {
        std::vector<AttributeTarget> attributes{};
        std::optional<std::string> raw_text{};
    };

}

#endif // TETHER_LOSS_TARGETS_HPP
