#ifndef TETHER_SEMANTIC_MODEL_HPP
#define TETHER_SEMANTIC_MODEL_HPP

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include <torch/torch.h>

namespace Tether::Semantic::Details {

    // Frozen joint vision-language embedding model (CLIP-like). Tether only reads from it:
    // both encoders are called under NoGradGuard and the returned embeddings are compared
    // with cosine similarity, so they must share the same trailing width.
    class Model {
    public:
        virtual ~Model() = default;

        [[nodiscard]] virtual torch::Tensor encode_text(const std::string& text) const = 0;
        [[nodiscard]] virtual torch::Tensor encode_image(const torch::Tensor& features) const = 0;
    };

    using ModelPtr = std::shared_ptr<Model>;

    // Adapts a pair of callables, e.g. wrapping a scripted CLIP module or a test double.
    class Lambda final : public Model {
    public:
        using TextEncoder = std::function<torch::Tensor(const std::string&)>;
        using ImageEncoder = std::function<torch::Tensor(const torch::Tensor&)>;

        Lambda(TextEncoder text_encoder, ImageEncoder image_encoder)
            : text_encoder_(std::move(text_encoder)), image_encoder_(std::move(image_encoder))
        {
            if (!text_encoder_ || !image_encoder_) {
                throw std::invalid_argument("Semantic::Lambda requires both a text and an image encoder.");
            }
        }

        [[nodiscard]] torch::Tensor encode_text(const std::string& text) const override
        {
            return text_encoder_(text);
        }

        [[nodiscard]] torch::Tensor encode_image(const torch::Tensor& features) const override
        {
            return image_encoder_(features);
        }

    private:
        TextEncoder text_encoder_;
        ImageEncoder image_encoder_;
    };

}

#endif // TETHER_SEMANTIC_MODEL_HPP
