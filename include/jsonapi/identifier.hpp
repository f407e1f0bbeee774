//! # Identifier Resolver Protocol
//!
//! Resource ids are strings on the wire, but the key types behind them need
//! not be. A key type opts into custom conversion by providing member
//! functions; the resolver picks the first capability that applies.
//!
//! ## Marshal Order
//!
//! 1. `marshal_id() const` if the type provides it (`MarshalIdentifier`)
//! 2. The value itself if it is a string type
//! 3. `to_string() const` if the type provides it (`Stringer`)
//! 4. Otherwise a `TypeMismatch` naming the type and the capabilities tried
//!
//! ## Unmarshal Order
//!
//! 1. `unmarshal_id(const std::string&)` if the type provides it
//!    (`UnmarshalIdentifier`); its error is returned unchanged
//! 2. Direct assignment if the target is a `std::string`
//! 3. Otherwise a `TypeMismatch`
//!
//! ## Example
//!
//! ```cpp
//! struct OrderKey {
//!     uint64_t value = 0;
//!     std::string marshal_id() const { return "ord-" + std::to_string(value); }
//!     Result<bool, Error> unmarshal_id(const std::string& id);
//! };
//!
//! auto id = marshal_identifier(OrderKey{42}); // "ord-42"
//! ```

#pragma once

#include "common.hpp"
#include "jsonapi/error.hpp"

#include <concepts>
#include <cstdlib>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>

#ifndef _MSC_VER
#include <cxxabi.h>
#endif

namespace jsonapi {

// ============================================================================
// Capabilities
// ============================================================================

/// Key types that choose their own wire string.
template <typename T>
concept MarshalIdentifier = requires(const T& value) {
    { value.marshal_id() } -> std::convertible_to<std::string>;
};

/// Key types that parse themselves from the wire string.
template <typename T>
concept UnmarshalIdentifier = requires(T& target, const std::string& id) {
    { target.unmarshal_id(id) } -> std::same_as<Result<bool, Error>>;
};

/// Types with a general purpose string form.
template <typename T>
concept Stringer = requires(const T& value) {
    { value.to_string() } -> std::convertible_to<std::string>;
};

/// Types whose value already is a string.
template <typename T>
concept StringLike = std::is_convertible_v<const T&, std::string_view>;

/// Readable name of `T` for error messages.
template <typename T> auto type_name() -> std::string {
    const char* mangled = typeid(T).name();
#ifdef _MSC_VER
    // MSVC already returns the readable name.
    return mangled;
#else
    int status = 0;
    char* demangled = abi::__cxa_demangle(mangled, nullptr, nullptr, &status);
    if (status != 0 || demangled == nullptr) {
        return mangled;
    }
    std::string name(demangled);
    std::free(demangled);
    return name;
#endif
}

// ============================================================================
// Resolution
// ============================================================================

/// Converts a key to its wire id, following the marshal order above.
template <typename T> auto marshal_identifier(const T& value) -> Result<std::string, Error> {
    if constexpr (MarshalIdentifier<T>) {
        return std::string(value.marshal_id());
    } else if constexpr (StringLike<T>) {
        return std::string(std::string_view(value));
    } else if constexpr (Stringer<T>) {
        return std::string(value.to_string());
    } else {
        return Error::type_mismatch(type_name<T>(), {"MarshalIdentifier", "string", "Stringer"});
    }
}

/// Writes the wire id `id` into `target`, following the unmarshal order above.
template <typename T>
auto unmarshal_identifier(const std::string& id, T& target) -> Result<bool, Error> {
    if constexpr (UnmarshalIdentifier<T>) {
        return target.unmarshal_id(id);
    } else if constexpr (std::is_same_v<T, std::string>) {
        target = id;
        return true;
    } else {
        return Error::type_mismatch(type_name<T>(), {"UnmarshalIdentifier", "string"});
    }
}

} // namespace jsonapi
