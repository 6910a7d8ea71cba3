#pragma once

#include <stdexcept>

namespace spanner {
    class Error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // Caller input rejected before any tokenizer or engine work.
    class ValidationError : public Error {
    public:
        using Error::Error;
    };

    // A collaborator broke its contract: missing output tensor, wrong shape, unknown special token.
    class ConfigurationError : public Error {
    public:
        using Error::Error;
    };

    class ModelNotFoundError : public Error {
    public:
        using Error::Error;
    };
}
