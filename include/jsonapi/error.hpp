//! # Codec Errors
//!
//! Every fallible codec operation returns `Result<T, Error>`. An `Error` is a
//! plain value: the kind says which rule was broken and the remaining fields
//! carry whatever detail that kind needs.
//!
//! | Kind | Detail fields |
//! |------|---------------|
//! | `MissingDataField` | none |
//! | `InvalidDataField` | none |
//! | `MissingLinkFields` | none |
//! | `TypeMismatch` | `actual`, `expected` |
//! | `PartialLinkage` | `resources` |
//! | `Syntax` | `message`, `line`, `column` |
//! | `MalformedData` | `message` |
//!
//! Identifier types that implement `unmarshal_id` build their own `Error`
//! values; those are passed back to the caller untouched.

#pragma once

#include "common.hpp"
#include "json/json_error.hpp"

#include <cstddef>
#include <set>
#include <string>
#include <vector>

namespace jsonapi {

enum class ErrorKind {
    MissingDataField,  ///< The document object has no members at all
    InvalidDataField,  ///< `"data"` is an empty object
    MissingLinkFields, ///< A links object has neither `self` nor `related`
    TypeMismatch,      ///< A value has the wrong type
    PartialLinkage,    ///< Included resources unreachable from primary data
    Syntax,            ///< Input is not valid JSON
    MalformedData      ///< Valid JSON that breaks a structural rule of the format
};

/// Returns a stable name for an error kind (e.g. "TypeMismatch").
auto error_kind_name(ErrorKind kind) -> const char*;

struct Error {
    ErrorKind kind = ErrorKind::MalformedData;

    /// Free-form detail for `Syntax`, `MalformedData` and custom errors.
    std::string message;

    /// Type found, for `TypeMismatch`.
    std::string actual;

    /// Acceptable type names, for `TypeMismatch`.
    std::vector<std::string> expected;

    /// Identities of unreachable included resources, for `PartialLinkage`.
    /// Formatted as `{Type: T, ID: I}`. Order carries no meaning.
    std::set<std::string> resources;

    /// Location of a `Syntax` error (1-based, 0 if unknown).
    size_t line = 0;
    size_t column = 0;

    static auto missing_data_field() -> Error;

    static auto invalid_data_field() -> Error;

    static auto missing_link_fields() -> Error;

    static auto type_mismatch(std::string actual, std::vector<std::string> expected) -> Error;

    static auto partial_linkage(std::set<std::string> resources) -> Error;

    static auto syntax(const json::JsonError& error) -> Error;

    static auto malformed(std::string message) -> Error;

    /// One-line description suitable for a terminal.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const Error& other) const -> bool = default;
};

} // namespace jsonapi
