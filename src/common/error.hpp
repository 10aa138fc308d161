#pragma once

#include <stdexcept>
#include <string>

namespace stella {

enum class ErrorKind {
    Parse,
    Validation,
    Format,
    CorruptPayload,
    Structural,
    Checksum,
    IO
};

// Problems found while decoding an RLEVOX stream.
enum class CodecErrorCode {
    BadMagic,
    UnsupportedVersion,
    UnsupportedEncoding,
    InvalidHeader,
    UnexpectedEof,
    InvalidRun,
    RowLengthMismatch
};

enum class StructuralErrorCode {
    NotAnArchive,
    MissingManifest,
    MissingEntry,
    LevelNotFound,
    ReservedPath,
    UnsafePath
};

const char* ErrorKindName(ErrorKind kind);
const char* CodecErrorCodeName(CodecErrorCode code);
const char* StructuralErrorCodeName(StructuralErrorCode code);

class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class ParseError : public Error {
public:
    explicit ParseError(const std::string& message);
};

class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message);
};

class FormatError : public Error {
public:
    FormatError(CodecErrorCode code, const std::string& message);

    CodecErrorCode code() const noexcept { return code_; }

private:
    CodecErrorCode code_;
};

class CorruptPayloadError : public Error {
public:
    CorruptPayloadError(CodecErrorCode code, const std::string& message);

    CodecErrorCode code() const noexcept { return code_; }

private:
    CodecErrorCode code_;
};

class StructuralError : public Error {
public:
    StructuralError(StructuralErrorCode code, const std::string& message);

    StructuralErrorCode code() const noexcept { return code_; }

private:
    StructuralErrorCode code_;
};

class IOError : public Error {
public:
    explicit IOError(const std::string& message);
};

} // namespace stella
