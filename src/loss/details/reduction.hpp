#ifndef TETHER_LOSS_REDUCTION_HPP
#define TETHER_LOSS_REDUCTION_HPP

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <string_view>

#include <torch/torch.h>

namespace Tether::Loss::Details {

    // Applied over the batch dimension only; attributes are always summed.
    enum class Reduction { Mean, Sum, None };

    [[nodiscard]] inline Reduction parse_reduction(std::string_view text)
    {
        std::string lowered(text);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lowered == "mean") {
            return Reduction::Mean;
        }
        if (lowered == "sum") {
            return Reduction::Sum;
        }
        if (lowered == "none") {
            return Reduction::None;
        }
        throw std::invalid_argument("Unknown reduction '" + std::string(text) + "'. Expected mean, sum or none.");
    }

    [[nodiscard]] constexpr const char* reduction_name(Reduction reduction) noexcept
    {
        switch (reduction) {
            case Reduction::Sum:  return "sum";
            case Reduction::None: return "none";
            case Reduction::Mean:
            default:              return "mean";
        }
    }

    inline torch::Tensor apply_reduction(torch::Tensor loss, Reduction reduction) {
        switch (reduction) {
            case Reduction::None:
                return loss;
            case Reduction::Sum:
                return loss.sum();
            case Reduction::Mean:
            default:
                return loss.mean();
        }
    }

}

#endif // TETHER_LOSS_REDUCTION_HPP
