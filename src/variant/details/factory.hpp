#ifndef TETHER_VARIANT_FACTORY_HPP
#define TETHER_VARIANT_FACTORY_HPP

#include <string>
#include <string_view>
#include <utility>

#include <torch/torch.h>

#include "../../loss/loss.hpp"
#include "../../utils/terminal.hpp"
#include "../../weights/weights.hpp"
#include "tag.hpp"

namespace Tether::Variant::Details {

    // Pure transform of a configuration snapshot; the source is taken by value and never touched.
    [[nodiscard]] inline Loss::Configuration configure(Loss::Configuration configuration, Tag tag)
    {
        switch (tag) {
            case Tag::NoSemanticPenalty:
                configuration.semantic_model.reset();
                break;
            case Tag::UniformPriority:
                configuration.weights = Weights::uniform(configuration.weights.names());
                break;
            case Tag::Full:
            case Tag::Baseline:
                break;
        }
        return configuration;
    }

    // Fresh AttributeLoss for the requested variant. New priority parameters seeded from the
    // configured table, placed on the source's device; nothing is shared with `source`
    // except the read-only semantic model handle.
    [[nodiscard]] inline Loss::AttributeLoss make_variant(const Loss::AttributeLossImpl& source, Tag tag)
    {
        auto configuration = configure(source.configuration(), tag);
        Loss::AttributeLoss variant(std::move(configuration), source.stream());
        variant->to(source.device());

        Utils::Terminal::Status(source.stream(), "Variant",
                                std::string(tag_name(tag)) + " -> " + variant->to_string(),
                                Utils::Terminal::Colors::kOrange);
        return variant;
    }

    [[nodiscard]] inline Loss::AttributeLoss make_variant(const Loss::AttributeLossImpl& source, std::string_view tag)
    {
        return make_variant(source, parse_tag(tag));
    }

}

#endif // TETHER_VARIANT_FACTORY_HPP
