#include "TransferError.hpp"

#include <utility>

TransferError::TransferError(TransferErrorKind kind, std::string path, std::string cause) : Kind(kind), Path(std::move(path)), Cause(std::move(cause))
{
}

bool TransferError::RequiresReauthorization() const
{
    return ErrorCategoryOf(Kind) == ErrorCategory::AccessDenied;
}

std::string TransferError::Describe() const
{
    std::string Text = ToString(Kind);
    if (!Path.empty())
    {
        Text += " [" + Path + "]";
    }
    if (!Cause.empty())
    {
        Text += ": " + Cause;
    }
    return Text;
}

ErrorCategory ErrorCategoryOf(TransferErrorKind Kind)
{
    switch (Kind)
    {
    case TransferErrorKind::None:                   return ErrorCategory::None;
    case TransferErrorKind::PermissionDenied:
    case TransferErrorKind::DestinationNotWritable: return ErrorCategory::AccessDenied;
    case TransferErrorKind::FileNotFound:
    case TransferErrorKind::SourceInvalid:
    case TransferErrorKind::DestinationInvalid:     return ErrorCategory::PathInvalid;
    case TransferErrorKind::CopyFailed:
    case TransferErrorKind::IOFailure:
    case TransferErrorKind::ScanFailed:
    case TransferErrorKind::NoFilesTransferred:     return ErrorCategory::IOFailure;
    case TransferErrorKind::ChecksumMismatch:       return ErrorCategory::ChecksumMismatch;
    case TransferErrorKind::Cancelled:              return ErrorCategory::Cancelled;
    case TransferErrorKind::PartialJobFailure:      return ErrorCategory::PartialJobFailure;
    }
    return ErrorCategory::IOFailure;
}

std::string ToString(TransferErrorKind Kind)
{
    switch (Kind)
    {
    case TransferErrorKind::None:                   return "None";
    case TransferErrorKind::FileNotFound:           return "File not found";
    case TransferErrorKind::SourceInvalid:          return "Source path is invalid";
    case TransferErrorKind::DestinationInvalid:     return "Destination path is invalid";
    case TransferErrorKind::DestinationNotWritable: return "Destination is not writable";
    case TransferErrorKind::CopyFailed:             return "Copy failed";
    case TransferErrorKind::ChecksumMismatch:       return "Checksum verification failed";
    case TransferErrorKind::Cancelled:              return "Transfer was cancelled";
    case TransferErrorKind::PermissionDenied:       return "Permission denied";
    case TransferErrorKind::IOFailure:              return "I/O failure";
    case TransferErrorKind::ScanFailed:             return "Source scan failed";
    case TransferErrorKind::PartialJobFailure:      return "Some files failed to transfer";
    case TransferErrorKind::NoFilesTransferred:     return "No files could be transferred";
    }
    return "Unknown";
}

std::string ToString(ErrorCategory Category)
{
    switch (Category)
    {
    case ErrorCategory::None:              return "None";
    case ErrorCategory::AccessDenied:      return "AccessDenied";
    case ErrorCategory::PathInvalid:       return "PathInvalid";
    case ErrorCategory::IOFailure:         return "IOFailure";
    case ErrorCategory::ChecksumMismatch:  return "ChecksumMismatch";
    case ErrorCategory::Cancelled:         return "Cancelled";
    case ErrorCategory::PartialJobFailure: return "PartialJobFailure";
    }
    return "Unknown";
}
