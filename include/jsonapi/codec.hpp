//! # Document Codec
//!
//! Converts between JSON text and `Document` values.
//!
//! ## Decoding
//!
//! `"data"` may be absent, `null`, an object or an array, and the right
//! target cannot be chosen before looking at it. Decoding therefore runs in
//! two passes over the parsed tree:
//!
//! 1. **Shape sniff** (`sniff_shape`): inspect only the generic JSON tree to
//!    decide between `None`, `One` and `Many`, rejecting `{}` documents and
//!    empty `"data"` objects.
//! 2. **Typed decode**: convert `"data"` into the alternative the sniff chose
//!    and read the fixed members (`meta`, `jsonapi`, `errors`, `links`,
//!    `included`).
//!
//! | Input | Result |
//! |-------|--------|
//! | `{}` | `MissingDataField` |
//! | `{"meta": {...}}` | shape `None` |
//! | `{"data": null}` | shape `None` |
//! | `{"data": {}}` | `InvalidDataField` |
//! | `{"data": {...}}` | shape `One` |
//! | `{"data": [...]}` | shape `Many`, also when empty |
//!
//! Relationship values are documents and go through the same two passes.
//!
//! ## Encoding
//!
//! - Non-empty `errors` suppresses `"data"` entirely
//! - Shape `Many` writes an array, even an empty one
//! - Otherwise `"data"` is the single resource or `null`
//!
//! Every other member is left out when empty. Links objects are checked with
//! `Link::check()` on the way out, so an empty `self` or `related` never
//! reaches the wire.

#pragma once

#include "common.hpp"
#include "json/json_parser.hpp"
#include "json/json_value.hpp"
#include "jsonapi/document.hpp"
#include "jsonapi/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace jsonapi {

struct EncodeOptions {
    /// 0 writes compact output; a positive value pretty-prints.
    int indent = 0;
};

struct DecodeOptions {
    /// Deepest array/object nesting accepted by the parser.
    size_t max_depth = json::DEFAULT_MAX_DEPTH;
};

/// First decoding pass: determines the primary data shape of `value`.
[[nodiscard]] auto sniff_shape(const json::JsonValue& value) -> Result<DataShape, Error>;

/// Lowers a document into a JSON tree.
[[nodiscard]] auto document_to_json(const Document& document) -> Result<json::JsonValue, Error>;

/// Builds a document from an already parsed JSON tree.
[[nodiscard]] auto document_from_json(const json::JsonValue& value) -> Result<Document, Error>;

[[nodiscard]] auto resource_to_json(const ResourceObject& resource)
    -> Result<json::JsonValue, Error>;

[[nodiscard]] auto resource_from_json(const json::JsonValue& value)
    -> Result<ResourceObject, Error>;

/// Serializes `document` to JSON text.
[[nodiscard]] auto encode_document(const Document& document, const EncodeOptions& options = {})
    -> Result<std::string, Error>;

/// Parses JSON text into a document.
///
/// Invalid JSON yields a `Syntax` error with the parser's line and column.
[[nodiscard]] auto decode_document(std::string_view text, const DecodeOptions& options = {})
    -> Result<Document, Error>;

} // namespace jsonapi
