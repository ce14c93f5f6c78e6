#ifndef TETHER_SEMANTIC_PENALTY_HPP
#define TETHER_SEMANTIC_PENALTY_HPP

#include <exception>
#include <optional>
#include <sstream>
#include <string>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "model.hpp"

namespace Tether::Semantic::Details {

    namespace detail {
        template <typename Encode>
        [[nodiscard]] torch::Tensor guarded_encode(const char* what, Encode&& encode)
        {
            torch::Tensor embedding;
            try {
                embedding = encode();
            } catch (const SemanticModelError&) {
                throw;
            } catch (const std::exception& error) {
                std::throw_with_nested(SemanticModelError(std::string("Semantic model failed in ") + what + ": " + error.what()));
            }
            if (!embedding.defined()) {
                throw SemanticModelError(std::string("Semantic model returned an undefined tensor from ") + what + ".");
            }
            if (embedding.dim() == 0) {
                throw SemanticModelError(std::string("Semantic model returned a scalar from ") + what + ", expected an embedding.");
            }
            return embedding;
        }

        [[nodiscard]] inline std::string format_shape(const torch::Tensor& tensor)
        {
            std::ostringstream stream;
            stream << tensor.sizes();
            return stream.str();
        }
    }

    // True when the penalty term takes part in the loss.
    [[nodiscard]] inline bool available(const ModelPtr& model, const std::optional<std::string>& text) noexcept
    {
        return model != nullptr && text.has_value() && !text->empty();
    }

    // 1 - mean cosine(encode_image(features), encode_text(text)), in [0, 2].
    // Computed under NoGradGuard and returned detached: it scales the loss but never
    // backpropagates into the embedding model or the features.
    [[nodiscard]] inline torch::Tensor penalty(const Model& model, const torch::Tensor& features, const std::string& text)
    {
        torch::NoGradGuard no_grad{};

        auto text_embedding = detail::guarded_encode("encode_text", [&] { return model.encode_text(text); });
        auto image_embedding = detail::guarded_encode("encode_image", [&] { return model.encode_image(features.detach()); });

        if (text_embedding.size(-1) != image_embedding.size(-1)) {
            throw SemanticModelError("Semantic model embeddings disagree in width: text "
                                     + detail::format_shape(text_embedding) + " vs image "
                                     + detail::format_shape(image_embedding) + ".");
        }

        image_embedding = image_embedding.to(torch::kFloat32);
        text_embedding = text_embedding.to(image_embedding.device(), torch::kFloat32);
        if (image_embedding.dim() == 1) {
            image_embedding = image_embedding.unsqueeze(0);
        }
        if (text_embedding.dim() == 1) {
            text_embedding = text_embedding.unsqueeze(0);
        }
        if (image_embedding.dim() == 2 && text_embedding.dim() == 2 && text_embedding.size(0) == 1) {
            text_embedding = text_embedding.expand_as(image_embedding);
        }
        if (text_embedding.sizes() != image_embedding.sizes()) {
            throw SemanticModelError("Semantic model embeddings cannot be paired row by row: text "
                                     + detail::format_shape(text_embedding) + " vs image "
                                     + detail::format_shape(image_embedding) + ".");
        }

        auto similarity = torch::nn::functional::cosine_similarity(
            image_embedding, text_embedding,
            torch::nn::functional::CosineSimilarityFuncOptions().dim(-1));

        return (1.0 - similarity.mean()).clamp(0.0, 2.0).detach();
    }

}

#endif // TETHER_SEMANTIC_PENALTY_HPP
