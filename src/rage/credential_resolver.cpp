//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// credential_resolver.cpp
//
// Resolution orchestrator
//===----------------------------------------------------------------------===//

#include "rage/credential_resolver.hpp"
#include "rage/location_resolver.hpp"
#include "rage/rage_exception.hpp"
#include "rage/secret_store.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/file_system.hpp"

#include <cstdio>
#include <cstdlib>

// Debug logging controlled by DUCK_RAGE_DEBUG environment variable
static int GetRageResolveDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("DUCK_RAGE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define DUCK_RAGE_RESOLVE_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                     \
		if (GetRageResolveDebugLevel() >= lvl)                               \
			fprintf(stderr, "[DUCK_RAGE RESOLVE] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace duckdb {
namespace rage {

CredentialResolver::CredentialResolver(FileSystem &fs, const EnvironmentProvider &env, Decryptor &decryptor,
                                       int64_t max_container_size)
    : fs_(fs), env_(env), decryptor_(decryptor), max_container_size_(max_container_size) {
}

std::vector<uint8_t> CredentialResolver::ReadContainer(const std::string &path) {
	std::vector<uint8_t> container;
	try {
		auto handle = fs_.OpenFile(path, FileFlags::FILE_FLAGS_READ);
		auto file_size = static_cast<int64_t>(handle->GetFileSize());
		if (file_size > max_container_size_) {
			throw LocationException("Secrets file '%s' is %lld bytes, larger than the maximum of %lld bytes", path,
			                        file_size, max_container_size_);
		}
		container.resize(static_cast<size_t>(file_size));
		idx_t offset = 0;
		while (offset < container.size()) {
			auto bytes_read = handle->Read(container.data() + offset, container.size() - offset);
			if (bytes_read <= 0) {
				break;
			}
			offset += static_cast<idx_t>(bytes_read);
		}
		container.resize(offset);
		handle->Close();
	} catch (const LocationException &) {
		throw;
	} catch (const std::exception &ex) {
		ErrorData error(ex);
		throw LocationException("Cannot read secrets file '%s': %s", path, error.RawMessage());
	}
	DUCK_RAGE_RESOLVE_DEBUG_LOG(2, "read %llu bytes from '%s'", (unsigned long long)container.size(), path.c_str());
	return container;
}

SecureBuffer CredentialResolver::DecryptContainer(const std::vector<uint8_t> &container,
                                                  const std::string &identity_path) {
	try {
		return decryptor_.Decrypt(container, identity_path);
	} catch (const DecryptionException &) {
		throw;
	} catch (const std::exception &ex) {
		// Uniform wrapping; the capability's own message is kept
		ErrorData error(ex);
		throw DecryptionException("%s failed: %s", decryptor_.GetName(), error.RawMessage());
	}
}

CredentialRecord CredentialResolver::Resolve(const ResolutionRequest &request) {
	request.Validate();

	auto snapshot = EnvironmentSnapshot::Capture(env_);
	LocationResolver location_resolver(fs_);
	auto locations = location_resolver.Resolve(request, snapshot);

	DUCK_RAGE_RESOLVE_DEBUG_LOG(1, "resolving key '%s' for database '%s'", request.secret_key.c_str(),
	                            request.database_name.c_str());

	auto container = ReadContainer(locations.secrets_file.path);

	SecureString secret_value;
	{
		auto store = SecretStore::Parse(DecryptContainer(container, locations.identity_file.path));
		secret_value = store.Extract(request.secret_key);
	}

	auto record = AssembleCredential(request, std::move(secret_value));
	DUCK_RAGE_RESOLVE_DEBUG_LOG(1, "assembled credential '%s'", record.secret_name.c_str());
	return record;
}

std::string CredentialResolver::ResolveAndRegister(const ResolutionRequest &request, CredentialSink &sink) {
	auto record = Resolve(request);
	return sink.Register(record);
}

std::string FormatRegistrationStatus(const CredentialRecord &record) {
	return "Secret '" + record.secret_name + "' created for " + record.connection_user + "@" + record.host + ":" +
	       std::to_string(record.port) + "/" + record.database_name;
}

}  // namespace rage
}  // namespace duckdb
