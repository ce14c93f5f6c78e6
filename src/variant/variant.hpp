#ifndef TETHER_VARIANT_HPP
#define TETHER_VARIANT_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/tag.hpp"
#include "details/factory.hpp"

namespace Tether::Variant {
    using Tag = Details::Tag;

    inline constexpr auto kAllTags = Details::kAllTags;

    using Details::configure;
    using Details::make_variant;
    using Details::parse_tag;
    using Details::tag_name;

    [[nodiscard]] inline Loss::AttributeLoss Make(const Loss::AttributeLoss& source, Tag tag) {
        return Details::make_variant(*source, tag);
    }

    [[nodiscard]] inline Loss::AttributeLoss Make(const Loss::AttributeLoss& source, std::string_view tag) {
        return Details::make_variant(*source, tag);
    }
}

#endif // TETHER_VARIANT_HPP
