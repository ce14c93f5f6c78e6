#ifndef TETHER_PRIORITY_STORE_HPP
#define TETHER_PRIORITY_STORE_HPP

#include <cstddef>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <torch/torch.h>

#include "../../common/errors.hpp"
#include "../../weights/weights.hpp"

namespace Tether::Priority::Details {

    inline constexpr const char* kParameterPrefix = "priority_";

    // torch::nn::Module rejects '.' in parameter names; the index keeps sanitized names unique.
    [[nodiscard]] inline std::string parameter_name(std::size_t index, const std::string& attribute)
    {
        std::string name = kParameterPrefix + std::to_string(index) + "_" + attribute;
        for (auto& character : name) {
            if (character == '.') {
                character = '_';
            }
        }
        return name;
    }

    // One trainable float32 scalar per attribute, seeded from the normalized weight.
    // No setter: values move only through the optimizer.
    class PriorityStoreImpl : public torch::nn::Module {
    public:
        explicit PriorityStoreImpl(const Weights::Table& table)
        {
            names_.reserve(table.size());
            parameters_.reserve(table.size());
            for (const auto& [name, weight] : table.entries()) {
                auto initial = torch::full({}, weight, torch::TensorOptions().dtype(torch::kFloat32));
                parameters_.push_back(register_parameter(parameter_name(names_.size(), name), initial));
                names_.push_back(name);
            }
        }

        [[nodiscard]] const torch::Tensor& value(const std::string& name) const
        {
            return parameters_[index_of(name)];
        }

        [[nodiscard]] bool contains(const std::string& name) const noexcept
        {
            for (const auto& candidate : names_) {
                if (candidate == name) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] std::size_t index_of(const std::string& name) const
        {
            for (std::size_t index = 0; index < names_.size(); ++index) {
                if (names_[index] == name) {
                    return index;
                }
            }
            throw UnknownAttributeError(name);
        }

        [[nodiscard]] const std::vector<std::string>& names() const noexcept { return names_; }
        [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }

        [[nodiscard]] std::vector<torch::Tensor> values() const { return parameters_; }

        [[nodiscard]] Weights::Entries snapshot() const
        {
            torch::NoGradGuard no_grad{};
            Weights::Entries out;
            out.reserve(names_.size());
            for (std::size_t index = 0; index < names_.size(); ++index) {
                out.emplace_back(names_[index], parameters_[index].detach().to(torch::kCPU).item<double>());
            }
            return out;
        }

        void pretty_print(std::ostream& stream) const override
        {
            stream << "Tether::PriorityStore(";
            for (std::size_t index = 0; index < names_.size(); ++index) {
                stream << (index > 0 ? ", " : "") << names_[index];
            }
            stream << ")";
        }

    private:
        std::vector<std::string> names_{};
        std::vector<torch::Tensor> parameters_{};
    };

    TORCH_MODULE(PriorityStore);

}

#endif // TETHER_PRIORITY_STORE_HPP
