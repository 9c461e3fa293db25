#include "rage/credential.hpp"
#include "rage/rage_exception.hpp"

#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"

#include <utility>

namespace duckdb {
namespace rage {

DatabaseKind ParseDatabaseKind(const std::string &text) {
	auto lower = StringUtil::Lower(text);
	if (lower == "postgres" || lower == "postgresql") {
		return DatabaseKind::POSTGRES;
	}
	if (lower == "mysql") {
		return DatabaseKind::MYSQL;
	}
	throw InvalidInputException("Unknown db_type '%s'. Supported: postgres, mysql", text);
}

const char *DatabaseKindToString(DatabaseKind kind) {
	switch (kind) {
	case DatabaseKind::POSTGRES:
		return "postgres";
	case DatabaseKind::MYSQL:
		return "mysql";
	}
	return "unknown";
}

void ResolutionRequest::Validate() const {
	const std::pair<const char *, const std::string *> required_fields[] = {
	    {"host", &host}, {"database", &database_name}, {"user", &connection_user}, {"secret_key", &secret_key}};
	for (auto &field : required_fields) {
		if (field.second->empty()) {
			throw AssemblyException("Field '%s' cannot be empty", field.first);
		}
	}
	if (port < 1 || port > 65535) {
		throw AssemblyException("Port must be between 1 and 65535. Got: %d", port);
	}
}

std::string DeriveSecretName(const std::string &database_name) {
	return StringUtil::Lower(std::string(RAGE_SECRET_NAME_PREFIX) + database_name);
}

CredentialRecord AssembleCredential(const ResolutionRequest &request, SecureString secret_value) {
	request.Validate();

	CredentialRecord record;
	record.secret_name = DeriveSecretName(request.database_name);
	record.database_kind = request.database_kind;
	record.host = request.host;
	record.port = request.port;
	record.database_name = request.database_name;
	record.connection_user = request.connection_user;
	record.secret_value = std::move(secret_value);
	return record;
}

}  // namespace rage
}  // namespace duckdb
