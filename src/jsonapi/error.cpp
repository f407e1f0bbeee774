#include "jsonapi/error.hpp"

namespace jsonapi {

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::MissingDataField:
        return "MissingDataField";
    case ErrorKind::InvalidDataField:
        return "InvalidDataField";
    case ErrorKind::MissingLinkFields:
        return "MissingLinkFields";
    case ErrorKind::TypeMismatch:
        return "TypeMismatch";
    case ErrorKind::PartialLinkage:
        return "PartialLinkage";
    case ErrorKind::Syntax:
        return "Syntax";
    case ErrorKind::MalformedData:
        return "MalformedData";
    }
    return "Unknown";
}

auto Error::missing_data_field() -> Error {
    Error e;
    e.kind = ErrorKind::MissingDataField;
    return e;
}

auto Error::invalid_data_field() -> Error {
    Error e;
    e.kind = ErrorKind::InvalidDataField;
    return e;
}

auto Error::missing_link_fields() -> Error {
    Error e;
    e.kind = ErrorKind::MissingLinkFields;
    return e;
}

auto Error::type_mismatch(std::string actual, std::vector<std::string> expected) -> Error {
    Error e;
    e.kind = ErrorKind::TypeMismatch;
    e.actual = std::move(actual);
    e.expected = std::move(expected);
    return e;
}

auto Error::partial_linkage(std::set<std::string> resources) -> Error {
    Error e;
    e.kind = ErrorKind::PartialLinkage;
    e.resources = std::move(resources);
    return e;
}

auto Error::syntax(const json::JsonError& error) -> Error {
    Error e;
    e.kind = ErrorKind::Syntax;
    e.message = error.message;
    e.line = error.line;
    e.column = error.column;
    return e;
}

auto Error::malformed(std::string message) -> Error {
    Error e;
    e.kind = ErrorKind::MalformedData;
    e.message = std::move(message);
    return e;
}

auto Error::to_string() const -> std::string {
    switch (kind) {
    case ErrorKind::MissingDataField:
        return "document must contain at least one of \"data\", \"errors\", \"meta\", "
               "\"jsonapi\" or \"links\"";
    case ErrorKind::InvalidDataField:
        return "primary data must be null, an array, or a non-empty resource object";
    case ErrorKind::MissingLinkFields:
        return "links object must contain a non-empty \"self\" or \"related\"";
    case ErrorKind::TypeMismatch: {
        std::string out = "got type \"" + actual + "\", expected one of";
        for (size_t i = 0; i < expected.size(); ++i) {
            out += i == 0 ? " \"" : ", \"";
            out += expected[i] + "\"";
        }
        return out;
    }
    case ErrorKind::PartialLinkage: {
        std::string out = "compound document is not fully linked, unreachable included resources:";
        for (const auto& id : resources) {
            out += " " + id;
        }
        return out;
    }
    case ErrorKind::Syntax:
        return "invalid JSON: " + json::JsonError::make(message, line, column).to_string();
    case ErrorKind::MalformedData:
        return message;
    }
    return message;
}

} // namespace jsonapi
