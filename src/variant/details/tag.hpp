#ifndef TETHER_VARIANT_TAG_HPP
#define TETHER_VARIANT_TAG_HPP

#include <array>
#include <string>
#include <string_view>

#include "../../common/errors.hpp"

namespace Tether::Variant::Details {

    enum class Tag { Baseline, NoSemanticPenalty, UniformPriority, Full };

    inline constexpr std::array<Tag, 4> kAllTags{Tag::Baseline, Tag::NoSemanticPenalty, Tag::UniformPriority, Tag::Full};

    [[nodiscard]] constexpr std::string_view tag_name(Tag tag) noexcept
    {
        switch (tag) {
            case Tag::NoSemanticPenalty: return "no_semantic_penalty";
            case Tag::UniformPriority:   return "uniform_priority";
            case Tag::Full:              return "full";
            case Tag::Baseline:
            default:                     return "baseline";
        }
    }

    // Unknown tags fail fast; there is no fallback to baseline.
    [[nodiscard]] inline Tag parse_tag(std::string_view text)
    {
        for (const auto tag : kAllTags) {
            if (tag_name(tag) == text) {
                return tag;
            }
        }
        throw UnknownVariantError(std::string(text));
    }

}

#endif // TETHER_VARIANT_TAG_HPP
