#pragma once

#include <stdexcept>
#include <string>

namespace ts {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Every delivery mechanism failed. Uploads degrade to the local fallback, downloads surface "cannot sync".
struct TransportError final : Error {
    using Error::Error;
};

// A document failed structured validation.
struct ParseError final : Error {
    using Error::Error;
};

// Post-write validation failed; the caller rolls back to the snapshot taken before the write.
struct IntegrityError final : Error {
    using Error::Error;
};

// A snapshot could not be captured, so the destructive write it guards must not happen.
struct BackupError final : Error {
    using Error::Error;
};

// Local metadata unreadable or corrupt. Treated as "no prior state".
struct MetadataError final : Error {
    using Error::Error;
};

struct ConfigError final : Error {
    using Error::Error;
};

}
