#ifndef TETHER_LOSS_ATTRIBUTE_LOSS_HPP
#define TETHER_LOSS_ATTRIBUTE_LOSS_HPP

#include <cmath>
#include <cstddef>
#include <iomanip>
#include <limits>
#include <optional>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../priority/priority.hpp"
#include "../../semantic/semantic.hpp"
#include "../../utils/terminal.hpp"
#include "../../weights/weights.hpp"
#include "alignment.hpp"
#include "reduction.hpp"
#include "targets.hpp"

namespace Tether::Loss::Details {

    inline constexpr double kDefaultSemanticCoefficient = 0.3;

    struct Options {
        Weights::Entries weights{};
        std::string reduction{"mean"};  // mean, sum or none; parsed at construction.
        Semantic::ModelPtr semantic_model{};
        double semantic_coefficient{kDefaultSemanticCoefficient};
        std::optional<double> max_grad_norm{};  // Used by clip_gradients(); the training loop calls it after backward().
        std::ostream* stream{nullptr};
    };

    // Immutable snapshot a loss is (re)built from. Holds the normalized table, never parameters.
    struct Configuration {
        Weights::Table weights{};
        Reduction reduction{Reduction::Mean};
        Semantic::ModelPtr semantic_model{};
        double semantic_coefficient{kDefaultSemanticCoefficient};
        std::optional<double> max_grad_norm{};
    };

    struct Components {
        torch::Tensor alignment{};
        std::optional<torch::Tensor> penalty{};
        torch::Tensor total{};
    };

    [[nodiscard]] inline Configuration make_configuration(const Options& options)
    {
        if (!std::isfinite(options.semantic_coefficient) || options.semantic_coefficient < 0.0) {
            throw std::invalid_argument("Semantic coefficient must be a finite, non-negative number.");
        }
        if (options.max_grad_norm && !(*options.max_grad_norm > 0.0)) {
            throw std::invalid_argument("max_grad_norm must be strictly positive when provided.");
        }
        return Configuration{
            .weights = Weights::normalize(options.weights),
            .reduction = parse_reduction(options.reduction),
            .semantic_model = options.semantic_model,
            .semantic_coefficient = options.semantic_coefficient,
            .max_grad_norm = options.max_grad_norm,
        };
    }

    class AttributeLossImpl : public torch::nn::Module {
    public:
        explicit AttributeLossImpl(const Options& options)
            : AttributeLossImpl(make_configuration(options), options.stream)
        {
        }

        explicit AttributeLossImpl(Configuration configuration, std::ostream* stream = nullptr)
            : configuration_(std::move(configuration)), stream_(stream)
        {
            if (configuration_.weights.empty()) {
                throw InvalidWeightsError("AttributeLoss requires a non-empty weight table.");
            }
            priorities_ = register_module("priorities", Priority::PriorityStore(configuration_.weights));

            std::ostringstream message;
            message << configuration_.weights.size() << " attribute(s) [" << join_names() << "], reduction="
                    << reduction_name(configuration_.reduction) << ", semantic penalty "
                    << (has_semantic_model() ? "on" : "off");
            Utils::Terminal::Status(stream_, "AttributeLoss", message.str());
        }

        // alignment + coefficient * penalty when a semantic model is attached and raw_text is
        // present, alignment alone otherwise.
        torch::Tensor forward(const torch::Tensor& features, const TargetsBundle& targets)
        {
            return components(features, targets).total;
        }

        [[nodiscard]] Components components(const torch::Tensor& features, const TargetsBundle& targets)
        {
            Components out{};
            out.alignment = Details::alignment(*priorities_, features, targets.attributes, configuration_.reduction);
            out.total = out.alignment;

            if (Semantic::available(configuration_.semantic_model, targets.raw_text)) {
                auto penalty = Semantic::penalty(*configuration_.semantic_model, features, *targets.raw_text)
                                   .to(out.alignment.device(), out.alignment.scalar_type());
                out.total = out.alignment + penalty * configuration_.semantic_coefficient;
                out.penalty = std::move(penalty);
            }
            return out;
        }

        // Post-backward hook for the owning training loop. Clips the priority gradients to
        // max_grad_norm when configured and returns the total norm measured before clipping.
        double clip_gradients()
        {
            const double max_norm = configuration_.max_grad_norm.value_or(std::numeric_limits<double>::infinity());
            return torch::nn::utils::clip_grad_norm_(parameters(), max_norm);
        }

        [[nodiscard]] const Configuration& configuration() const noexcept { return configuration_; }
        [[nodiscard]] const Weights::Table& weights() const noexcept { return configuration_.weights; }
        [[nodiscard]] const std::vector<std::string>& names() const noexcept { return priorities_->names(); }
        [[nodiscard]] Weights::Entries priorities() const { return priorities_->snapshot(); }
        [[nodiscard]] torch::Tensor priority(const std::string& name) const { return priorities_->value(name); }
        [[nodiscard]] Reduction reduction() const noexcept { return configuration_.reduction; }
        [[nodiscard]] double semantic_coefficient() const noexcept { return configuration_.semantic_coefficient; }
        [[nodiscard]] bool has_semantic_model() const noexcept { return configuration_.semantic_model != nullptr; }
        [[nodiscard]] const Semantic::ModelPtr& semantic_model() const noexcept { return configuration_.semantic_model; }
        [[nodiscard]] std::ostream* stream() const noexcept { return stream_; }

        [[nodiscard]] torch::Device device() const
        {
            return priorities_->values().front().device();
        }

        void pretty_print(std::ostream& stream) const override
        {
            stream << "Tether::AttributeLoss(attributes=[" << join_names() << "], semantic_model="
                   << (has_semantic_model() ? "attached" : "none") << ", reduction=" << reduction_name(configuration_.reduction)
                   << ")";
        }

        [[nodiscard]] std::string to_string() const
        {
            std::ostringstream stream;
            pretty_print(stream);
            return stream.str();
        }

        // Colored multi-line summary for terminals: ordered attributes with their initial
        // weight and live priority.
        void describe(std::ostream& stream) const
        {
            using namespace Utils::Terminal;
            constexpr std::size_t kWidth = 44;
            const auto flags = stream.flags();
            const auto precision = stream.precision();

            stream << TopBarRounded(kWidth, Colors::kTurquoise) << '\n';
            stream << ApplyColor(Symbols::kBoxVertical, Colors::kTurquoise) << ' '
                   << ApplyColor("AttributeLoss", Colors::kGoldenrod) << "  reduction=" << reduction_name(configuration_.reduction)
                   << "  coefficient=" << configuration_.semantic_coefficient << '\n';

            const auto live = priorities();
            const auto& initial = configuration_.weights.entries();
            for (std::size_t index = 0; index < live.size(); ++index) {
                stream << ApplyColor(Symbols::kBoxVertical, Colors::kTurquoise) << ' ' << Symbols::kDot << ' '
                       << std::left << std::setw(16) << live[index].first << std::right
                       << " weight " << std::fixed << std::setprecision(4) << initial[index].second
                       << "  priority " << live[index].second << std::defaultfloat << '\n';
            }

            stream << ApplyColor(Symbols::kBoxVertical, Colors::kTurquoise) << ' ' << "semantic model "
                   << (has_semantic_model() ? ApplyColor(Symbols::kCheck, Colors::kBrightGreen)
                                            : ApplyColor(Symbols::kCross, Colors::kRed))
                   << '\n';
            stream << BottomBarRounded(kWidth, Colors::kTurquoise) << '\n';
            stream.flags(flags);
            stream.precision(precision);
        }

    private:
        [[nodiscard]] std::string join_names() const
        {
            std::string out;
            for (const auto& name : configuration_.weights.names()) {
                if (!out.empty()) {
                    out += ", ";
                }
                out += name;
            }
            return out;
        }

        Configuration configuration_;
        std::ostream* stream_{nullptr};
        Priority::PriorityStore priorities_{nullptr};
    };

    TORCH_MODULE(AttributeLoss);

}

#endif // TETHER_LOSS_ATTRIBUTE_LOSS_HPP
