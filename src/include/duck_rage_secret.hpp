//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// duck_rage_secret.hpp
//
// Registers resolved credentials with DuckDB's secret manager
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb.hpp"
#include "duckdb/main/secret/secret.hpp"
#include "rage/credential_sink.hpp"

namespace duckdb {

// Secret field names (constants)
constexpr const char *DUCK_RAGE_SECRET_HOST = "host";
constexpr const char *DUCK_RAGE_SECRET_PORT = "port";
constexpr const char *DUCK_RAGE_SECRET_DATABASE = "database";
constexpr const char *DUCK_RAGE_SECRET_USER = "user";
constexpr const char *DUCK_RAGE_SECRET_PASSWORD = "password";

constexpr const char *DUCK_RAGE_SECRET_PROVIDER = "config";

// Build the KeyValueSecret for a record; password is redacted
unique_ptr<KeyValueSecret> CreateDuckRageSecret(const rage::CredentialRecord &record);

// Temporary, create-or-replace registration. Nothing is written to disk and
// no SQL text containing the password is ever produced.
class SecretManagerSink : public rage::CredentialSink {
public:
	explicit SecretManagerSink(ClientContext &context) : context_(context) {
	}

	std::string Register(const rage::CredentialRecord &record) override;

private:
	ClientContext &context_;
};

}  // namespace duckdb
