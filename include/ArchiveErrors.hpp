#pragma once
#include <stdexcept>
#include <string>

// Recoverable-by-rerun failures of an archive run. Any of them aborts the
// current partition and, through ArchiveDriver, the whole run.
class ArchiveError : public std::runtime_error
{
public:
    enum class Kind
    {
        Discovery, // archive range could not be determined
        Io,        // open/create/read/write/rename failed
        Codec      // malformed row data in the store or a partition file
    };

    ArchiveError(Kind kind, std::string const& message)
        : std::runtime_error(message), errorKind(kind)
    {
    }

    Kind kind() const noexcept { return errorKind; }

private:
    Kind errorKind;
};

// Row counts disagree between what was handed to a writer and what it
// reports written. The output can no longer be trusted.
class InvariantViolation : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

inline char const* toString(ArchiveError::Kind kind) noexcept
{
    switch (kind)
    {
        case ArchiveError::Kind::Discovery: return "discovery";
        case ArchiveError::Kind::Io:        return "io";
        case ArchiveError::Kind::Codec:     return "codec";
    }
    return "unknown";
}
