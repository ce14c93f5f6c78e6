#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <torch/torch.h>

#include "../include/Tether.h"

namespace {
    // Image side is the identity on features; text side is a fixed direction.
    Tether::Semantic::ModelPtr fixed_text_model(torch::Tensor text_embedding) {
        return Tether::Semantic::FromLambda(
            [text_embedding](const std::string&) { return text_embedding; },
            [](const torch::Tensor& features) { return features; });
    }

    class ThrowingModel final : public Tether::Semantic::Model {
    public:
        torch::Tensor encode_text(const std::string&) const override {
            throw std::runtime_error("tokenizer unavailable");
        }
        torch::Tensor encode_image(const torch::Tensor& features) const override {
            return features;
        }
    };
}

TEST(SemanticTest, AlignedEmbeddingsGiveZeroPenalty) {
    auto model = fixed_text_model(torch::tensor({1.0f, 0.0f, 0.0f}));
    auto features = torch::tensor({{2.0f, 0.0f, 0.0f}, {0.5f, 0.0f, 0.0f}});

    auto penalty = Tether::Semantic::penalty(*model, features, "a red chair");

    EXPECT_EQ(penalty.dim(), 0);
    EXPECT_NEAR(penalty.item<double>(), 0.0, 1e-6);
}

TEST(SemanticTest, OppositeEmbeddingsGiveMaximumPenalty) {
    auto model = fixed_text_model(torch::tensor({{1.0f, 1.0f}}));
    auto features = torch::tensor({{-1.0f, -1.0f}, {-3.0f, -3.0f}});

    auto penalty = Tether::Semantic::penalty(*model, features, "text");

    EXPECT_NEAR(penalty.item<double>(), 2.0, 1e-6);
}

TEST(SemanticTest, PenaltyAveragesCosineOverBatch) {
    auto model = fixed_text_model(torch::tensor({1.0f, 0.0f}));
    auto features = torch::tensor({{1.0f, 0.0f}, {0.0f, 1.0f}});

    auto penalty = Tether::Semantic::penalty(*model, features, "text");

    EXPECT_NEAR(penalty.item<double>(), 0.5, 1e-6);
}

TEST(SemanticTest, PenaltyCarriesNoGradient) {
    auto model = fixed_text_model(torch::randn({6}));
    auto features = torch::randn({3, 6}, torch::requires_grad());

    auto penalty = Tether::Semantic::penalty(*model, features, "text");

    EXPECT_FALSE(penalty.requires_grad());
    EXPECT_FALSE(penalty.grad_fn());
}

TEST(SemanticTest, PenaltyStaysWithinBounds) {
    torch::manual_seed(11);
    for (int trial = 0; trial < 20; ++trial) {
        auto model = fixed_text_model(torch::randn({16}));
        auto value = Tether::Semantic::penalty(*model, torch::randn({4, 16}), "text").item<double>();
        EXPECT_GE(value, 0.0);
        EXPECT_LE(value, 2.0);
    }
}

TEST(SemanticTest, AvailabilityNeedsModelAndText) {
    auto model = fixed_text_model(torch::ones({2}));

    EXPECT_TRUE(Tether::Semantic::available(model, std::string("text")));
    EXPECT_FALSE(Tether::Semantic::available(model, std::nullopt));
    EXPECT_FALSE(Tether::Semantic::available(model, std::string()));
    EXPECT_FALSE(Tether::Semantic::available(nullptr, std::string("text")));
}

TEST(SemanticTest, ModelFailureIsWrappedWithOriginalNested) {
    ThrowingModel model;

    try {
        (void)Tether::Semantic::penalty(model, torch::randn({2, 4}), "text");
        FAIL() << "model failure was swallowed";
    } catch (const Tether::SemanticModelError& error) {
        EXPECT_NE(std::string(error.what()).find("tokenizer unavailable"), std::string::npos);
        try {
            std::rethrow_if_nested(error);
            FAIL() << "original exception was not nested";
        } catch (const std::runtime_error& original) {
            EXPECT_STREQ(original.what(), "tokenizer unavailable");
        }
    }
}

TEST(SemanticTest, MismatchedEmbeddingWidthsAreRejected) {
    auto model = fixed_text_model(torch::ones({3}));
    EXPECT_THROW((void)Tether::Semantic::penalty(*model, torch::randn({2, 4}), "text"), Tether::SemanticModelError);
}

TEST(SemanticTest, TextRowsThatCannotPairWithBatchAreRejected) {
    auto model = fixed_text_model(torch::ones({3, 4}));
    EXPECT_THROW((void)Tether::Semantic::penalty(*model, torch::randn({2, 4}), "text"), Tether::SemanticModelError);
}

TEST(SemanticTest, PerSampleTextEmbeddingsAreAccepted) {
    auto model = fixed_text_model(torch::tensor({{1.0f, 0.0f}, {0.0f, 1.0f}}));
    auto features = torch::tensor({{1.0f, 0.0f}, {0.0f, 1.0f}});

    EXPECT_NEAR(Tether::Semantic::penalty(*model, features, "text").item<double>(), 0.0, 1e-6);
}

TEST(SemanticTest, UndefinedEmbeddingIsRejected) {
    auto model = Tether::Semantic::FromLambda(
        [](const std::string&) { return torch::Tensor(); },
        [](const torch::Tensor& features) { return features; });
    EXPECT_THROW((void)Tether::Semantic::penalty(*model, torch::randn({2, 4}), "text"), Tether::SemanticModelError);
}

TEST(SemanticTest, LambdaRequiresBothEncoders) {
    EXPECT_THROW(Tether::Semantic::Lambda(nullptr, [](const torch::Tensor& f) { return f; }), std::invalid_argument);
}
