#pragma once

#include <utility>
#include <variant>

namespace NonoGen {

/**
 * Either a value or an error, never both.
 *
 * Example:
 *   Result<Puzzle, PuzzleError> result = Puzzle::validate(...);
 *   if (result.isError()) {
 *       LOG_WARN(Puzzle, "{}", result.errorValue().toString());
 *   }
 */
template <typename T, typename E>
class Result {
public:
    static Result okay(T value) { return Result(std::in_place_index<0>, std::move(value)); }
    static Result error(E error) { return Result(std::in_place_index<1>, std::move(error)); }

    bool isValue() const { return storage_.index() == 0; }
    bool isError() const { return storage_.index() == 1; }

    T& value() & { return std::get<0>(storage_); }
    const T& value() const& { return std::get<0>(storage_); }
    T&& value() && { return std::get<0>(std::move(storage_)); }

    E& errorValue() & { return std::get<1>(storage_); }
    const E& errorValue() const& { return std::get<1>(storage_); }
    E&& errorValue() && { return std::get<1>(std::move(storage_)); }

private:
    template <std::size_t I, typename U>
    Result(std::in_place_index_t<I> tag, U&& payload) : storage_(tag, std::forward<U>(payload))
    {}

    std::variant<T, E> storage_;
};

} // namespace NonoGen
