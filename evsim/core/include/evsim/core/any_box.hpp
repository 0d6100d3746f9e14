#pragma once

#include <evsim/core/error.hpp>

#include <memory>
#include <string_view>
#include <type_traits>
#include <utility>

namespace evsim::core::detail {

/// @brief Move-only, type-erased owner of a single value.
/// @ingroup core_internal
///
/// Unlike `std::any`, AnyBox accepts move-only types. The stored type is
/// recovered with get<T>(), which returns nullptr when @p T is not the
/// exact type that was stored. Callers that hold a typed handle use
/// checked<T>() instead: a mismatch there means a handle was used against
/// storage it was not minted from, which is fatal.
class AnyBox {
public:
    AnyBox() = default;

    template<typename T, typename = std::enable_if_t<!std::is_same_v<std::decay_t<T>, AnyBox>>>
    explicit AnyBox(T&& value)
        : holder_(std::make_unique<Holder<std::decay_t<T>>>(std::forward<T>(value))) {}

    AnyBox(AnyBox&&) noexcept = default;
    AnyBox& operator=(AnyBox&&) noexcept = default;
    AnyBox(const AnyBox&) = delete;
    AnyBox& operator=(const AnyBox&) = delete;

    [[nodiscard]] bool has_value() const noexcept { return holder_ != nullptr; }

    template<typename T>
    [[nodiscard]] T* get() noexcept {
        auto* holder = dynamic_cast<Holder<T>*>(holder_.get());
        return holder != nullptr ? &holder->value : nullptr;
    }

    template<typename T>
    [[nodiscard]] const T* get() const noexcept {
        const auto* holder = dynamic_cast<const Holder<T>*>(holder_.get());
        return holder != nullptr ? &holder->value : nullptr;
    }

    /// @brief Access the stored value, aborting if it is not a @p T.
    template<typename T>
    [[nodiscard]] T& checked(std::string_view what) noexcept {
        T* value = get<T>();
        if (value == nullptr) {
            invariant_failure(what);
        }
        return *value;
    }

    template<typename T>
    [[nodiscard]] const T& checked(std::string_view what) const noexcept {
        const T* value = get<T>();
        if (value == nullptr) {
            invariant_failure(what);
        }
        return *value;
    }

private:
    struct HolderBase {
        virtual ~HolderBase() = default;
    };

    template<typename T>
    struct Holder final : HolderBase {
        template<typename U>
        explicit Holder(U&& v) : value(std::forward<U>(v)) {}
        T value;
    };

    std::unique_ptr<HolderBase> holder_;
};

} // namespace evsim::core::detail
