//! # jsonapi
//!
//! Encoding, decoding and compound-document checks for JSON:API payloads.
//!
//! | Header | Contents |
//! |--------|----------|
//! | `jsonapi/error.hpp` | `Error`, `ErrorKind` |
//! | `jsonapi/link.hpp` | `Link`, `check_meta`, link validation |
//! | `jsonapi/identifier.hpp` | identifier resolver protocol |
//! | `jsonapi/document.hpp` | `ResourceObject`, `Document` |
//! | `jsonapi/linkable.hpp` | link provider capabilities, `make_identifier` |
//! | `jsonapi/codec.hpp` | `encode_document`, `decode_document` |
//! | `jsonapi/linkage.hpp` | `verify_full_linkage` |

#pragma once

#include "common.hpp"
#include "jsonapi/codec.hpp"
#include "jsonapi/document.hpp"
#include "jsonapi/error.hpp"
#include "jsonapi/identifier.hpp"
#include "jsonapi/link.hpp"
#include "jsonapi/linkable.hpp"
#include "jsonapi/linkage.hpp"
