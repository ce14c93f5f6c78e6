#ifndef TETHER_WEIGHTS_TABLE_HPP
#define TETHER_WEIGHTS_TABLE_HPP

#include <cmath>
#include <cstddef>
#include <initializer_list>
#include <numeric>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

#include "../../common/errors.hpp"

namespace Tether::Weights::Details {

    using Entry = std::pair<std::string, double>;
    using Entries = std::vector<Entry>;

    inline constexpr double kSumTolerance = 1e-6;

    // Normalized attribute -> weight table. Insertion order is the canonical attribute order
    // and never changes after construction. Only `normalize` and `uniform` build one.
    class Table {
    public:
        Table() = default;

        [[nodiscard]] const Entries& entries() const noexcept { return entries_; }
        [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
        [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

        [[nodiscard]] std::vector<std::string> names() const
        {
            std::vector<std::string> out;
            out.reserve(entries_.size());
            for (const auto& [name, weight] : entries_) {
                out.push_back(name);
            }
            return out;
        }

        [[nodiscard]] std::vector<double> weights() const
        {
            std::vector<double> out;
            out.reserve(entries_.size());
            for (const auto& [name, weight] : entries_) {
                out.push_back(weight);
            }
            return out;
        }

        [[nodiscard]] bool contains(const std::string& name) const noexcept
        {
            for (const auto& entry : entries_) {
                if (entry.first == name) {
                    return true;
                }
            }
            return false;
        }

        [[nodiscard]] std::size_t index_of(const std::string& name) const
        {
            for (std::size_t index = 0; index < entries_.size(); ++index) {
                if (entries_[index].first == name) {
                    return index;
                }
            }
            throw UnknownAttributeError(name);
        }

        [[nodiscard]] double weight(const std::string& name) const
        {
            return entries_[index_of(name)].second;
        }

        [[nodiscard]] double sum() const noexcept
        {
            return std::accumulate(entries_.begin(), entries_.end(), 0.0,
                                   [](double acc, const Entry& entry) { return acc + entry.second; });
        }

        friend bool operator==(const Table& lhs, const Table& rhs) { return lhs.entries_ == rhs.entries_; }

    private:
        explicit Table(Entries entries) : entries_(std::move(entries)) {}

        friend Table normalize(const Entries& entries);
        friend Table uniform(const std::vector<std::string>& names);

        Entries entries_{};
    };

    inline void validate_names(const std::vector<std::string>& names)
    {
        if (names.empty()) {
            throw InvalidWeightsError("Attribute weights must contain at least one entry.");
        }
        std::unordered_set<std::string> seen;
        seen.reserve(names.size());
        for (const auto& name : names) {
            if (name.empty()) {
                throw InvalidWeightsError("Attribute names must be non-empty strings.");
            }
            if (!seen.insert(name).second) {
                throw InvalidWeightsError("Attribute '" + name + "' is listed more than once.");
            }
        }
    }

    // Validates then divides every weight by the total. The input is left untouched.
    [[nodiscard]] inline Table normalize(const Entries& entries)
    {
        std::vector<std::string> names;
        names.reserve(entries.size());
        for (const auto& [name, weight] : entries) {
            names.push_back(name);
        }
        validate_names(names);

        double total = 0.0;
        for (const auto& [name, weight] : entries) {
            if (!std::isfinite(weight)) {
                throw InvalidWeightsError("Weight for attribute '" + name + "' is not a finite number.");
            }
            if (weight < 0.0) {
                throw InvalidWeightsError("Weight for attribute '" + name + "' is negative (" + std::to_string(weight) + ").");
            }
            total += weight;
        }
        if (!(total > 0.0) || !std::isfinite(total)) {
            throw InvalidWeightsError("Attribute weights must have a positive, finite sum.");
        }

        Entries normalized;
        normalized.reserve(entries.size());
        for (const auto& [name, weight] : entries) {
            normalized.emplace_back(name, weight / total);
        }
        return Table(std::move(normalized));
    }

    [[nodiscard]] inline Table normalize(std::initializer_list<Entry> entries)
    {
        return normalize(Entries(entries));
    }

    // 1/N for each name, order preserved.
    [[nodiscard]] inline Table uniform(const std::vector<std::string>& names)
    {
        validate_names(names);
        const double share = 1.0 / static_cast<double>(names.size());
        Entries entries;
        entries.reserve(names.size());
        for (const auto& name : names) {
            entries.emplace_back(name, share);
        }
        return Table(std::move(entries));
    }

}

#endif // TETHER_WEIGHTS_TABLE_HPP
