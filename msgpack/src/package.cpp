#include "package.hpp"
#include "errors.hpp"
#include <stdexcept>

const char* cipher_name(CipherAlg c) {
    switch (c) {
        case CipherAlg::AES256GCM:        return "AES-256-GCM";
        case CipherAlg::ChaCha20Poly1305: return "ChaCha20-Poly1305";
    }
    throw std::invalid_argument("Unknown CipherAlg");
}

CipherAlg cipher_from_name(const std::string& name) {
    if (name == "AES-256-GCM" || name == "AES")
        return CipherAlg::AES256GCM;
    if (name == "ChaCha20-Poly1305" || name == "ChaCha20")
        return CipherAlg::ChaCha20Poly1305;
    throw std::invalid_argument("unknown cipher '" + name +
                                "' (must be AES-256-GCM or ChaCha20-Poly1305)");
}

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Format:            return "FormatError";
        case ErrorKind::Integrity:         return "IntegrityError";
        case ErrorKind::Authentication:    return "AuthenticationError";
        case ErrorKind::RecipientNotFound: return "RecipientNotFound";
        case ErrorKind::Crypto:            return "CryptoError";
        case ErrorKind::ResourceLimit:     return "ResourceLimitExceeded";
        case ErrorKind::PathSecurity:      return "PathSecurityError";
    }
    return "PackageError";
}
