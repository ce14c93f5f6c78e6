#ifndef TETHER_LOSS_ALIGNMENT_HPP
#define TETHER_LOSS_ALIGNMENT_HPP

#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../priority/priority.hpp"
#include "reduction.hpp"
#include "targets.hpp"

namespace Tether::Loss::Details {

    namespace F = torch::nn::functional;

    namespace detail {
        [[nodiscard]] inline std::string shape_of(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << tensor.sizes();
            return stream.str();
        }

        // Cosine math stays in float32 when autocast hands over half or bfloat16 tensors.
        [[nodiscard]] inline torch::ScalarType compute_dtype(const torch::Tensor& features)
        {
            const auto type = features.scalar_type();
            if (type == torch::kHalf || type == torch::kBFloat16 || !at::isFloatingType(type)) {
                return torch::kFloat32;
            }
            return type;
        }

        inline void check_features(const torch::Tensor& features)
        {
            if (!features.defined()) {
                throw DimensionMismatchError("Alignment requires a defined feature tensor.");
            }
            if (features.dim() != 2) {
                throw DimensionMismatchError("Alignment expects features shaped [B, D], got " + shape_of(features) + ".");
            }
            if (features.size(0) == 0 || features.size(1) == 0) {
                throw DimensionMismatchError("Alignment expects a non-empty feature batch, got " + shape_of(features) + ".");
            }
        }

        inline void check_target(const AttributeTarget& target, const torch::Tensor& features)
        {
            const auto& vector = target.vector;
            if (!vector.defined()) {
                throw DimensionMismatchError("Target vector for attribute '" + target.name + "' is undefined.");
            }
            if (vector.dim() < 1 || vector.dim() > 2) {
                throw DimensionMismatchError("Target vector for attribute '" + target.name + "' must be [D] or [B, D], got "
                                             + shape_of(vector) + ".");
            }
            if (vector.size(-1) != features.size(1)) {
                throw DimensionMismatchError("Attribute '" + target.name + "' has dimension " + std::to_string(vector.size(-1))
                                             + " but features have dimension " + std::to_string(features.size(1)) + ".");
            }
            if (vector.dim() == 2 && vector.size(0) != 1 && vector.size(0) != features.size(0)) {
                throw DimensionMismatchError("Attribute '" + target.name + "' provides " + std::to_string(vector.size(0))
                                             + " rows for a batch of " + std::to_string(features.size(0)) + ".");
            }
        }
    }

    // Per-sample 1 - cos(features, vector) along the feature dimension, shape [B].
    [[nodiscard]] inline torch::Tensor dissimilarity(const torch::Tensor& features, const torch::Tensor& vector)
    {
        auto target = vector.to(features.device(), features.scalar_type());
        if (target.dim() == 1) {
            target = target.unsqueeze(0);
        }
        target = target.expand_as(features);
        auto similarity = F::cosine_similarity(features, target, F::CosineSimilarityFuncOptions().dim(1));
        return 1.0 - similarity;
    }

    // Sum over attributes of priority(name) * reduce_batch(1 - cos). Every name and shape is
    // checked before any arithmetic so a bad bundle fails without a partial graph.
    [[nodiscard]] inline torch::Tensor alignment(const Priority::PriorityStoreImpl& store,
                                                 const torch::Tensor& features,
                                                 const std::vector<AttributeTarget>& targets,
                                                 Reduction reduction = Reduction::Mean)
    {
        detail::check_features(features);

        std::vector<std::size_t> slots;
        slots.reserve(targets.size());
        for (const auto& target : targets) {
            slots.push_back(store.index_of(target.name));
            detail::check_target(target, features);
        }

        const auto working = features.to(detail::compute_dtype(features));
        const auto priorities = store.values();

        torch::Tensor total;
        for (std::size_t index = 0; index < targets.size(); ++index) {
            auto per_sample = dissimilarity(working, targets[index].vector);
            auto term = apply_reduction(per_sample, reduction) * priorities[slots[index]];
            total = total.defined() ? total + term : term;
        }

        if (!total.defined()) {
            auto options = working.options().requires_grad(false);
            return reduction == Reduction::None ? torch::zeros({working.size(0)}, options) : torch::zeros({}, options);
        }
        return total;
    }

}

#endif // TETHER_LOSS_ALIGNMENT_HPP
