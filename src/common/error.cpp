#include "common/error.hpp"

namespace stella {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Parse:
        return "ParseError";
    case ErrorKind::Validation:
        return "ValidationError";
    case ErrorKind::Format:
        return "FormatError";
    case ErrorKind::CorruptPayload:
        return "CorruptPayload";
    case ErrorKind::Structural:
        return "StructuralError";
    case ErrorKind::Checksum:
        return "ChecksumMismatch";
    case ErrorKind::IO:
        return "IOError";
    }
    return "unknown";
}

const char* CodecErrorCodeName(CodecErrorCode code) {
    switch (code) {
    case CodecErrorCode::BadMagic:
        return "BadMagic";
    case CodecErrorCode::UnsupportedVersion:
        return "UnsupportedVersion";
    case CodecErrorCode::UnsupportedEncoding:
        return "UnsupportedEncoding";
    case CodecErrorCode::InvalidHeader:
        return "InvalidHeader";
    case CodecErrorCode::UnexpectedEof:
        return "UnexpectedEof";
    case CodecErrorCode::InvalidRun:
        return "InvalidRun";
    case CodecErrorCode::RowLengthMismatch:
        return "RowLengthMismatch";
    }
    return "unknown";
}

const char* StructuralErrorCodeName(StructuralErrorCode code) {
    switch (code) {
    case StructuralErrorCode::NotAnArchive:
        return "NotAnArchive";
    case StructuralErrorCode::MissingManifest:
        return "MissingManifest";
    case StructuralErrorCode::MissingEntry:
        return "MissingEntry";
    case StructuralErrorCode::LevelNotFound:
        return "LevelNotFound";
    case StructuralErrorCode::ReservedPath:
        return "ReservedPath";
    case StructuralErrorCode::UnsafePath:
        return "UnsafePath";
    }
    return "unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(message),
      kind_(kind) {}

ParseError::ParseError(const std::string& message)
    : Error(ErrorKind::Parse, message) {}

ValidationError::ValidationError(const std::string& message)
    : Error(ErrorKind::Validation, message) {}

FormatError::FormatError(CodecErrorCode code, const std::string& message)
    : Error(ErrorKind::Format, message),
      code_(code) {}

CorruptPayloadError::CorruptPayloadError(CodecErrorCode code, const std::string& message)
    : Error(ErrorKind::CorruptPayload, message),
      code_(code) {}

StructuralError::StructuralError(StructuralErrorCode code, const std::string& message)
    : Error(ErrorKind::Structural, message),
      code_(code) {}

IOError::IOError(const std::string& message)
    : Error(ErrorKind::IO, message) {}

} // namespace stella
