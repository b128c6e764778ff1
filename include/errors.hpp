#pragma once
#include <stdexcept>
#include <string>

enum class ErrorKind {
    Format,
    Integrity,
    Authentication,
    RecipientNotFound,
    Crypto,
    ResourceLimit,
    PathSecurity
};

// Taxonomy name as printed by the CLI, e.g. "IntegrityError".
const char* error_kind_name(ErrorKind kind);

// Base of every failure raised while reading, checking or opening a package.
class PackageError : public std::runtime_error {
public:
    PackageError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

class FormatError : public PackageError {
public:
    explicit FormatError(const std::string& what)
        : PackageError(ErrorKind::Format, what) {}
};

class IntegrityError : public PackageError {
public:
    explicit IntegrityError(const std::string& what)
        : PackageError(ErrorKind::Integrity, what) {}
};

class AuthenticationError : public PackageError {
public:
    explicit AuthenticationError(const std::string& what)
        : PackageError(ErrorKind::Authentication, what) {}
};

class RecipientNotFound : public PackageError {
public:
    explicit RecipientNotFound(const std::string& what)
        : PackageError(ErrorKind::RecipientNotFound, what) {}
};

class CryptoError : public PackageError {
public:
    explicit CryptoError(const std::string& what)
        : PackageError(ErrorKind::Crypto, what) {}
};

class ResourceLimitExceeded : public PackageError {
public:
    explicit ResourceLimitExceeded(const std::string& what)
        : PackageError(ErrorKind::ResourceLimit, what) {}
};

class PathSecurityError : public PackageError {
public:
    explicit PathSecurityError(const std::string& what)
        : PackageError(ErrorKind::PathSecurity, what) {}
};
