#ifndef SANDSIM_RESULT_H
#define SANDSIM_RESULT_H

#include <expected>
#include <utility>

namespace SandSim {

/**
 * Result<T, E>: Thin wrapper around C++23 std::expected.
 *
 * Used for fallible I/O at the edges (settings files). The grid core itself
 * has no recoverable errors.
 */
template <typename successT, typename failureT>
class Result {
private:
    std::expected<successT, failureT> inner_;

public:
    Result(successT value) : inner_(std::move(value)) {}
    Result(std::unexpected<failureT> err) : inner_(std::move(err)) {}

    static Result<successT, failureT> okay(successT value)
    {
        return Result<successT, failureT>(std::move(value));
    }

    static Result<successT, failureT> error(failureT err)
    {
        return Result<successT, failureT>(std::unexpected(std::move(err)));
    }

    bool isValue() const { return inner_.has_value(); }
    bool isError() const { return !inner_.has_value(); }

    const successT& value() const& { return inner_.value(); }
    successT value() && { return std::move(inner_).value(); }

    successT valueOr(successT fallback) const& { return inner_.value_or(std::move(fallback)); }

    // Named errorValue() so it does not collide with the static error() factory.
    const failureT& errorValue() const& { return inner_.error(); }
    failureT errorValue() && { return std::move(inner_).error(); }
};

} // namespace SandSim

#endif // SANDSIM_RESULT_H
