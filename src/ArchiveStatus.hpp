#pragma once
#include <string>
#include <utility>
#include <arrow/result.h>
#include <arrow/status.h>
#include "ArchiveErrors.hpp"

// Arrow status helpers for the archive sources.

// Converts a failed arrow::Status into an ArchiveError of the given kind.
#define ARCHIVE_THROW_IF_NOT_OK(kind, expr)                        \
    do                                                             \
    {                                                              \
        ::arrow::Status _s = (expr);                               \
        if (!_s.ok())                                              \
        {                                                          \
            throw ArchiveError((kind),                             \
                std::string(#expr) + " -> " + _s.ToString());      \
        }                                                          \
    } while (0)

template <typename T>
T valueOrThrow(arrow::Result<T> result, ArchiveError::Kind kind, std::string const& what)
{
    if (!result.ok())
        throw ArchiveError(kind, what + " -> " + result.status().ToString());
    return std::move(result).ValueOrDie();
}
