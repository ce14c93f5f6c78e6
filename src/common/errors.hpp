#ifndef TETHER_COMMON_ERRORS_HPP
#define TETHER_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace Tether {
    // Root of every error Tether throws. Nothing is retried or swallowed internally,
    // all of these surface synchronously to the immediate caller.
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Malformed weight table at construction: empty, negative, non finite, duplicated
    // names or a zero sum.
    class InvalidWeightsError final : public Error {
    public:
        using Error::Error;
    };

    class UnknownAttributeError final : public Error {
    public:
        explicit UnknownAttributeError(const std::string& name)
            : Error("Unknown attribute '" + name + "': no priority parameter was registered for it."),
              name_(name)
        {
        }

        [[nodiscard]] const std::string& name() const noexcept { return name_; }

    private:
        std::string name_;
    };

    class DimensionMismatchError final : public Error {
    public:
        using Error::Error;
    };

    // Wraps whatever the external embedding model threw; the original is kept nested, so
    // this type must stay non-final for std::throw_with_nested.
    class SemanticModelError : public Error {
    public:
        using Error::Error;
    };

    class UnknownVariantError final : public Error {
    public:
        explicit UnknownVariantError(const std::string& tag)
            : Error("Unknown variant '" + tag + "'. Expected one of: baseline, no_semantic_penalty, uniform_priority, full."),
              tag_(tag)
        {
        }

        [[nodiscard]] const std::string& tag() const noexcept { return tag_; }

    private:
        std::string tag_;
    };
}

#endif // TETHER_COMMON_ERRORS_HPP
