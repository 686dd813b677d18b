#pragma once

#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace ACE {

// EN: Value-or-error return type used by the storage and merge layers.
// FR: Type de retour valeur-ou-erreur utilisé par les couches stockage et fusion.
template<typename T, typename E>
class Result {
public:
    static_assert(!std::is_same_v<T, E>, "Result value and error types must differ");

    Result(const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    bool hasValue() const { return storage_.index() == 0; }
    explicit operator bool() const { return hasValue(); }

    T& value() & {
        ensureValue();
        return std::get<0>(storage_);
    }
    const T& value() const& {
        ensureValue();
        return std::get<0>(storage_);
    }
    T&& value() && {
        ensureValue();
        return std::get<0>(std::move(storage_));
    }

    const E& error() const {
        if (hasValue()) {
            throw std::logic_error("Result holds a value, not an error");
        }
        return std::get<1>(storage_);
    }

    T valueOr(T fallback) const {
        return hasValue() ? std::get<0>(storage_) : std::move(fallback);
    }

private:
    void ensureValue() const {
        if (!hasValue()) {
            throw std::logic_error("Result holds an error, not a value");
        }
    }

    std::variant<T, E> storage_;
};

// EN: Specialization for operations that only report success or failure.
// FR: Spécialisation pour les opérations qui ne rapportent que succès ou échec.
template<typename E>
class Result<void, E> {
public:
    Result() = default;
    Result(const E& error) : error_(error) {}
    Result(E&& error) : error_(std::move(error)) {}

    bool hasValue() const { return !error_.has_value(); }
    explicit operator bool() const { return hasValue(); }

    const E& error() const {
        if (!error_) {
            throw std::logic_error("Result holds no error");
        }
        return *error_;
    }

private:
    std::optional<E> error_;
};

} // namespace ACE
