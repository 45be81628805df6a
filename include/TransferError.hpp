#pragma once

#include <string>

enum class TransferErrorKind
{
    None,
    FileNotFound,
    SourceInvalid,
    DestinationInvalid,
    DestinationNotWritable,
    CopyFailed,
    ChecksumMismatch,
    Cancelled,
    PermissionDenied,
    IOFailure,
    ScanFailed,
    PartialJobFailure,
    NoFilesTransferred
};

// Coarse classes the caller reacts to (re-prompt, retry, report).
enum class ErrorCategory
{
    None,
    AccessDenied,
    PathInvalid,
    IOFailure,
    ChecksumMismatch,
    Cancelled,
    PartialJobFailure
};

struct TransferError
{
    TransferErrorKind Kind = TransferErrorKind::None;
    std::string Path;
    std::string Cause;

    TransferError() = default;
    TransferError(TransferErrorKind kind, std::string path, std::string cause = std::string());

    bool IsSet() const { return Kind != TransferErrorKind::None; }
    bool RequiresReauthorization() const;
    std::string Describe() const;

    // Payload (Path, Cause) is diagnostic only and never part of the comparison.
    bool operator==(const TransferError& Other) const { return Kind == Other.Kind; }
    bool operator!=(const TransferError& Other) const { return Kind != Other.Kind; }
};

ErrorCategory ErrorCategoryOf(TransferErrorKind Kind);
std::string ToString(TransferErrorKind Kind);
std::string ToString(ErrorCategory Category);
