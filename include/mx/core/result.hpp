#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace mx {

// Wrapper types let Result<T, E> disambiguate when T == E, and let Ok()/Err()
// convert into any Result without naming both template arguments.
template<typename T>
struct OkValue {
    T value;
    explicit OkValue(T v) : value(std::move(v)) {}
};

template<>
struct OkValue<void> {};

template<typename E>
struct ErrValue {
    E error;
    explicit ErrValue(E e) : error(std::move(e)) {}
};

template<typename T, typename E = std::string>
class Result {
private:
    std::variant<T, E> data_;

public:
    template<typename U>
    Result(OkValue<U> ok) : data_(std::in_place_index<0>, std::move(ok.value)) {}

    template<typename F>
    Result(ErrValue<F> err) : data_(std::in_place_index<1>, std::move(err.error)) {}

    bool is_ok() const { return data_.index() == 0; }
    bool is_error() const { return data_.index() == 1; }

    T& value() { return std::get<0>(data_); }
    const T& value() const { return std::get<0>(data_); }

    E& error() { return std::get<1>(data_); }
    const E& error() const { return std::get<1>(data_); }

    T value_or(T default_value) const {
        return is_ok() ? value() : std::move(default_value);
    }
};

template<typename E>
class Result<void, E> {
public:
    Result() : error_(std::nullopt) {}
    Result(OkValue<void>) : error_(std::nullopt) {}

    template<typename F>
    Result(ErrValue<F> err) : error_(std::move(err.error)) {}

    bool is_ok() const { return !error_.has_value(); }
    bool is_error() const { return error_.has_value(); }

    const E& error() const { return error_.value(); }

private:
    std::optional<E> error_;
};

template<typename T>
OkValue<T> Ok(T value) { return OkValue<T>(std::move(value)); }

inline OkValue<void> Ok() { return OkValue<void>{}; }

template<typename E>
ErrValue<E> Err(E error) { return ErrValue<E>(std::move(error)); }

inline ErrValue<std::string> Err(const char* message) { return ErrValue<std::string>(std::string(message)); }

} // namespace mx
