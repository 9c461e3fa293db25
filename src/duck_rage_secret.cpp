#include "duck_rage_secret.hpp"
#include "duckdb/catalog/catalog_transaction.hpp"
#include "duckdb/main/secret/secret_manager.hpp"

#include <cstdio>
#include <cstdlib>

// Debug logging controlled by DUCK_RAGE_DEBUG environment variable
static int GetRageSecretDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("DUCK_RAGE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define DUCK_RAGE_SECRET_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                    \
		if (GetRageSecretDebugLevel() >= lvl)                               \
			fprintf(stderr, "[DUCK_RAGE SECRET] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace duckdb {

//===----------------------------------------------------------------------===//
// Secret creation
//===----------------------------------------------------------------------===//

unique_ptr<KeyValueSecret> CreateDuckRageSecret(const rage::CredentialRecord &record) {
	vector<string> scope;
	auto result = make_uniq<KeyValueSecret>(scope, rage::DatabaseKindToString(record.database_kind),
	                                        DUCK_RAGE_SECRET_PROVIDER, record.secret_name);

	result->secret_map[DUCK_RAGE_SECRET_HOST] = Value(record.host);
	result->secret_map[DUCK_RAGE_SECRET_PORT] = Value::INTEGER(record.port);
	result->secret_map[DUCK_RAGE_SECRET_DATABASE] = Value(record.database_name);
	result->secret_map[DUCK_RAGE_SECRET_USER] = Value(record.connection_user);
	// The Value keeps its own copy; wipe the intermediate one
	auto password = record.secret_value.GetString();
	result->secret_map[DUCK_RAGE_SECRET_PASSWORD] = Value(password);
	rage::SecureZero(&password[0], password.size());

	// Hidden in duckdb_secrets() output
	result->redact_keys.insert(DUCK_RAGE_SECRET_PASSWORD);

	return result;
}

//===----------------------------------------------------------------------===//
// SecretManagerSink
//===----------------------------------------------------------------------===//

std::string SecretManagerSink::Register(const rage::CredentialRecord &record) {
	auto secret = CreateDuckRageSecret(record);
	auto &secret_manager = SecretManager::Get(context_);
	auto transaction = CatalogTransaction::GetSystemCatalogTransaction(context_);
	secret_manager.RegisterSecret(transaction, std::move(secret), OnCreateConflict::REPLACE_ON_CONFLICT,
	                              SecretPersistType::TEMPORARY);

	DUCK_RAGE_SECRET_DEBUG_LOG(1, "registered %s secret '%s'", rage::DatabaseKindToString(record.database_kind),
	                           record.secret_name.c_str());
	return rage::FormatRegistrationStatus(record);
}

}  // namespace duckdb
