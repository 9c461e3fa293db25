//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/credential.hpp
//
// Resolution request, credential record and the assembler joining them
//===----------------------------------------------------------------------===//

#pragma once

#include "rage/secure_buffer.hpp"

#include <cstdint>
#include <string>

namespace duckdb {
namespace rage {

// Prefix of every derived secret name
constexpr const char *RAGE_SECRET_NAME_PREFIX = "duck_rage_";

enum class DatabaseKind : uint8_t { POSTGRES, MYSQL };

// Parse a db_type argument: postgres | postgresql | mysql (case-insensitive)
// Throws: InvalidInputException for anything else
DatabaseKind ParseDatabaseKind(const std::string &text);

// DuckDB secret TYPE keyword for the kind
const char *DatabaseKindToString(DatabaseKind kind);

//===----------------------------------------------------------------------===//
// ResolutionRequest - the caller's intent for one resolution
//===----------------------------------------------------------------------===//

struct ResolutionRequest {
	DatabaseKind database_kind = DatabaseKind::POSTGRES;
	std::string host;
	int32_t port = 0;
	std::string database_name;
	std::string connection_user;
	// Name of the value to extract from the secrets store
	std::string secret_key;
	// Optional overrides; empty means not supplied
	std::string secrets_file_override;
	std::string identity_file_override;

	// Throws: AssemblyException on empty required fields or port outside 1..65535
	void Validate() const;
};

//===----------------------------------------------------------------------===//
// CredentialRecord - finished connection descriptor handed to a sink
//
// Holds the decrypted password. Never log or persist it.
//===----------------------------------------------------------------------===//

struct CredentialRecord {
	std::string secret_name;
	DatabaseKind database_kind = DatabaseKind::POSTGRES;
	std::string host;
	int32_t port = 0;
	std::string database_name;
	std::string connection_user;
	SecureString secret_value;

	CredentialRecord() = default;
	CredentialRecord(const CredentialRecord &) = delete;
	CredentialRecord &operator=(const CredentialRecord &) = delete;
	CredentialRecord(CredentialRecord &&) noexcept = default;
	CredentialRecord &operator=(CredentialRecord &&) noexcept = default;
};

// "duck_rage_" + database_name, lower-cased. The name is not sanitized.
std::string DeriveSecretName(const std::string &database_name);

// Combine a validated request with the looked-up value
CredentialRecord AssembleCredential(const ResolutionRequest &request, SecureString secret_value);

}  // namespace rage
}  // namespace duckdb
