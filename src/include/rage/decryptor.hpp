//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/decryptor.hpp
//
// Boundary to the external decryption capability
//===----------------------------------------------------------------------===//

#pragma once

#include "rage/secure_buffer.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace duckdb {
namespace rage {

// Opens an encrypted secrets container with an identity file.
// The encryption format is opaque to callers; the call is atomic and blocking.
class Decryptor {
public:
	virtual ~Decryptor() = default;

	// Returns the cleartext
	// Throws: DecryptionException on wrong identity, malformed container,
	// or an unavailable capability
	virtual SecureBuffer Decrypt(const std::vector<uint8_t> &container, const std::string &identity_path) = 0;

	// Short description for diagnostics
	virtual std::string GetName() const = 0;
};

}  // namespace rage
}  // namespace duckdb
