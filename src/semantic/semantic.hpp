#ifndef TETHER_SEMANTIC_HPP
#define TETHER_SEMANTIC_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <memory>
#include <utility>

#include "details/model.hpp"
#include "details/penalty.hpp"

namespace Tether::Semantic {
    using Model = Details::Model;
    using ModelPtr = Details::ModelPtr;
    using Lambda = Details::Lambda;

    using Details::available;
    using Details::penalty;

    [[nodiscard]] inline ModelPtr FromLambda(Lambda::TextEncoder text_encoder, Lambda::ImageEncoder image_encoder) {
        return std::make_shared<Lambda>(std::move(text_encoder), std::move(image_encoder));
    }
}

#endif // TETHER_SEMANTIC_HPP
