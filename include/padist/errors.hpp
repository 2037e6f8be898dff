// include/padist/errors.hpp — Exception types reported by distribution and action code.

#pragma once

#include <stdexcept>
#include <string>

namespace padist {

    // Malformed input or a mathematical impossibility ("self is zero", "not a scalar multiple").
    class value_error : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    // A result that the recorded precision does not determine.
    class precision_error : public std::domain_error {
      public:
        using std::domain_error::domain_error;
    };

    // A matrix outside the monoid the action is defined on.
    class action_error : public std::invalid_argument {
      public:
        using std::invalid_argument::invalid_argument;
    };

    // An operation that only one of the two representations implements.
    class unsupported_operation : public std::logic_error {
      public:
        using std::logic_error::logic_error;
    };

} // namespace padist
