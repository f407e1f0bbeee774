//! # Full Linkage Verification
//!
//! A compound document is fully linked when every resource in `included` can
//! be reached from primary data by following relationships. Nodes of the
//! graph are resource identities (`{Type: T, ID: I}`); edges are the
//! relationship targets of each included resource.
//!
//! ## Traversal
//!
//! ```text
//! primary data ──rel──▶ placeholder ──identity──▶ included node
//!                                                     │
//!                                   rel targets ◀─────┘ (first visit only)
//! ```
//!
//! - Targets with no matching included resource point outside the document
//!   and are not followed
//! - A node already visited is not expanded again, so cycles terminate
//! - Every reached placeholder is recorded, revisits included, so aliasing
//!   covers all of them
//!
//! ## Aliasing
//!
//! With `alias_relationships` set and the check passing, each reached
//! placeholder is overwritten with a copy of the included resource it names.
//! Copies are taken from `included` as it was before aliasing, so nested
//! relationships stay thin identifiers.

#pragma once

#include "common.hpp"
#include "jsonapi/document.hpp"
#include "jsonapi/error.hpp"

namespace jsonapi {

/// Checks that every included resource is reachable from primary data.
///
/// # Returns
///
/// `true` when `document.included` is empty or fully linked, otherwise a
/// `PartialLinkage` error listing the unreachable identities. The document is
/// only modified when the check passes and `alias_relationships` is set.
[[nodiscard]] auto verify_full_linkage(Document& document, bool alias_relationships = false)
    -> Result<bool, Error>;

} // namespace jsonapi
