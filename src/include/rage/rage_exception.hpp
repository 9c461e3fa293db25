//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/rage_exception.hpp
//
// Error taxonomy of the credential resolution pipeline
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/exception.hpp"

#include <string>

namespace duckdb {
namespace rage {

// Stage that produced the failure
enum class RageErrorKind : uint8_t {
	LOCATION,
	DECRYPTION,
	MALFORMED_STORE,
	SECRET_NOT_FOUND,
	ASSEMBLY
};

// Stage tag used as message prefix, e.g. "[location]"
const char *RageErrorKindToString(RageErrorKind kind);

//===----------------------------------------------------------------------===//
// RageException - base of every pipeline error
//
// Messages identify the failing stage and never carry decrypted material.
//===----------------------------------------------------------------------===//

class RageException : public Exception {
public:
	RageException(RageErrorKind kind, ExceptionType type, const std::string &msg);

	RageErrorKind GetKind() const {
		return kind;
	}

private:
	RageErrorKind kind;
};

// A resolved path is missing or unreadable, or no source yields a path
class LocationException : public RageException {
public:
	explicit LocationException(const std::string &msg);

	template <typename... ARGS>
	explicit LocationException(const std::string &msg, ARGS... params)
	    : LocationException(ConstructMessage(msg, params...)) {
	}
};

// The decryption capability rejected the container or identity, or is unavailable
class DecryptionException : public RageException {
public:
	explicit DecryptionException(const std::string &msg);

	template <typename... ARGS>
	explicit DecryptionException(const std::string &msg, ARGS... params)
	    : DecryptionException(ConstructMessage(msg, params...)) {
	}
};

// Decrypted content is not a flat string-to-string mapping
class MalformedStoreException : public RageException {
public:
	explicit MalformedStoreException(const std::string &msg);

	template <typename... ARGS>
	explicit MalformedStoreException(const std::string &msg, ARGS... params)
	    : MalformedStoreException(ConstructMessage(msg, params...)) {
	}
};

// The requested key is absent from the store
class SecretNotFoundException : public RageException {
public:
	explicit SecretNotFoundException(const std::string &msg);

	template <typename... ARGS>
	explicit SecretNotFoundException(const std::string &msg, ARGS... params)
	    : SecretNotFoundException(ConstructMessage(msg, params...)) {
	}
};

// Invalid connection parameters
class AssemblyException : public RageException {
public:
	explicit AssemblyException(const std::string &msg);

	template <typename... ARGS>
	explicit AssemblyException(const std::string &msg, ARGS... params)
	    : AssemblyException(ConstructMessage(msg, params...)) {
	}
};

}  // namespace rage
}  // namespace duckdb
