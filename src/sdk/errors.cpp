//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include <docmap/sdk/errors.hpp>

#include <string>
#include <utility>

namespace docmap
{
namespace sdk
{

bool isDuplicateKeyCode(const int code) noexcept
{
    switch (code)
    {
    case WriteErrorCode::DuplicateKey:
    case WriteErrorCode::DuplicateKeyOnUpdate:
    case WriteErrorCode::DuplicateKeyLegacy:
        return true;
    default:
        return false;
    }
}

WriteError::Var classifyWriteError(const int code, std::string message)
{
    if (isDuplicateKeyCode(code))
    {
        return DuplicateKeyError{code, std::move(message)};
    }
    return OperationError{code, std::move(message)};
}

}  // namespace sdk
}  // namespace docmap
