#ifndef TETHER_LOSS_HPP
#define TETHER_LOSS_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/reduction.hpp"
#include "details/targets.hpp"
#include "details/alignment.hpp"
#include "details/attribute_loss.hpp"

namespace Tether::Loss {
    using Reduction = Details::Reduction;
    using AttributeTarget = Details::AttributeTarget;
    using TargetsBundle = Details::TargetsBundle;
    using Options = Details::Options;
    using Configuration = Details::Configuration;
    using Components = Details::Components;
    using AttributeLossImpl = Details::AttributeLossImpl;
    using AttributeLoss = Details::AttributeLoss;

    inline constexpr double kDefaultSemanticCoefficient = Details::kDefaultSemanticCoefficient;

    using Details::alignment;
    using Details::parse_reduction;
    using Details::reduction_name;

    [[nodiscard]] inline AttributeLoss Attribute(const Options& options) {
        return AttributeLoss(options);
    }
}

#endif // TETHER_LOSS_HPP
