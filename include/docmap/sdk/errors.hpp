//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#ifndef DOCMAP_SDK_ERRORS_HPP_INCLUDED
#define DOCMAP_SDK_ERRORS_HPP_INCLUDED

#include "index_spec.hpp"

#include <cetl/cetl.hpp>
#include <cetl/pf17/cetlpf.hpp>

#include <string>

namespace docmap
{
namespace sdk
{

/// Schema metadata is invalid: unresolvable path, malformed declaration, bad options.
///
/// Raised at schema definition time, so never from the store round trip.
///
struct ConfigError final
{
    std::string message;

};  // ConfigError

/// No schema is registered under the requested name.
///
struct NotRegisteredError final
{
    std::string schema_name;

};  // NotRegisteredError

/// The store already has an index on the same keys but with different constraints.
///
struct IndexConflictError final
{
    IndexSpec   requested;
    std::string existing_name;
    std::string message;

};  // IndexConflictError

/// The store round trip has failed (connection, timeout, server error).
///
struct TransportError final
{
    int         code{0};
    std::string message;

};  // TransportError

/// A write has violated a unique index.
///
struct DuplicateKeyError final
{
    int         code{0};
    std::string message;

};  // DuplicateKeyError

/// Any other write failure reported by the store.
///
struct OperationError final
{
    int         code{0};
    std::string message;

};  // OperationError

/// Store error codes which mean a unique index violation.
///
struct WriteErrorCode final
{
    static constexpr int DuplicateKey         = 11000;
    static constexpr int DuplicateKeyOnUpdate = 11001;
    static constexpr int DuplicateKeyLegacy   = 12582;

};  // WriteErrorCode

struct WriteError final
{
    using Var = cetl::variant<DuplicateKeyError, OperationError>;
};

CETL_NODISCARD bool isDuplicateKeyCode(const int code) noexcept;

/// Maps a write failure reported by the store into the caller visible taxonomy,
/// so that unique violations may be handled separately from other failures.
///
CETL_NODISCARD WriteError::Var classifyWriteError(const int code, std::string message);

}  // namespace sdk
}  // namespace docmap

#endif  // DOCMAP_SDK_ERRORS_HPP_INCLUDED
