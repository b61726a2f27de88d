// include/errors.hpp
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace ChunkStore {

// Where a failure happened. Any field may be empty when it does not apply.
struct ErrorContext {
    std::string chunk_id;
    std::optional<uint64_t> chunk_index;
    std::string provider;

    std::string describe() const {
        std::string out;
        if (!chunk_id.empty()) out += " chunk=" + chunk_id;
        if (chunk_index) out += " index=" + std::to_string(*chunk_index);
        if (!provider.empty()) out += " provider=" + provider;
        return out;
    }
};

// Base class for every error the core raises.
class ChunkStoreError : public std::runtime_error {
public:
    ChunkStoreError(const std::string& kind, const std::string& message, ErrorContext ctx = {})
        : std::runtime_error(kind + ": " + message + ctx.describe()), context_(std::move(ctx)) {}

    const ErrorContext& context() const { return context_; }

private:
    ErrorContext context_;
};

// Local read/write failure.
class IOFailure : public ChunkStoreError {
public:
    explicit IOFailure(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("IOFailure", message, std::move(ctx)) {}
};

// A manifest or chunk file the caller named does not exist.
class NotFound : public IOFailure {
public:
    explicit NotFound(const std::string& message, ErrorContext ctx = {}) : IOFailure(message, std::move(ctx)) {}
};

// The cipher itself failed (context allocation, RNG, key setup).
class EncryptionFailure : public ChunkStoreError {
public:
    explicit EncryptionFailure(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("EncryptionFailure", message, std::move(ctx)) {}
};

// GCM tag did not verify: wrong password or tampered ciphertext.
class AuthenticationFailure : public ChunkStoreError {
public:
    explicit AuthenticationFailure(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("AuthenticationFailure", message, std::move(ctx)) {}
};

// Ciphertext shorter than a nonce.
class MalformedCiphertext : public ChunkStoreError {
public:
    explicit MalformedCiphertext(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("MalformedCiphertext", message, std::move(ctx)) {}
};

// Plaintext hash differs from the recorded content hash.
class IntegrityFailure : public ChunkStoreError {
public:
    explicit IntegrityFailure(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("IntegrityFailure", message, std::move(ctx)) {}
};

class MalformedManifest : public ChunkStoreError {
public:
    explicit MalformedManifest(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("MalformedManifest", message, std::move(ctx)) {}
};

// No recorded destination could supply the chunk.
class ChunkUnavailable : public ChunkStoreError {
public:
    explicit ChunkUnavailable(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("ChunkUnavailable", message, std::move(ctx)) {}
};

class ConfigurationError : public ChunkStoreError {
public:
    explicit ConfigurationError(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("ConfigurationError", message, std::move(ctx)) {}
};

// Raised by storage backends. The orchestrator treats both kinds as a failed replica.
class BackendError : public ChunkStoreError {
public:
    BackendError(const std::string& message, bool transient, ErrorContext ctx = {})
        : ChunkStoreError(transient ? "BackendError(transient)" : "BackendError", message, std::move(ctx)),
          transient_(transient) {}

    bool isTransient() const { return transient_; }

private:
    bool transient_;
};

// Raised after an upload pass when replica failures are configured to be fatal.
class UploadFailure : public ChunkStoreError {
public:
    explicit UploadFailure(const std::string& message, ErrorContext ctx = {})
        : ChunkStoreError("UploadFailure", message, std::move(ctx)) {}
};

// HTTP status the service answers with for an error escaping the core.
inline int httpStatusFor(const std::exception& e) {
    if (dynamic_cast<const ConfigurationError*>(&e)) return 400;
    if (dynamic_cast<const AuthenticationFailure*>(&e) || dynamic_cast<const IntegrityFailure*>(&e) ||
        dynamic_cast<const MalformedCiphertext*>(&e)) {
        return 422;
    }
    if (dynamic_cast<const ChunkUnavailable*>(&e)) return 503;
    if (dynamic_cast<const NotFound*>(&e) || dynamic_cast<const MalformedManifest*>(&e)) return 404;
    return 500;
}

} // namespace ChunkStore
