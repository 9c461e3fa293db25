//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/credential_resolver.hpp
//
// Runs the resolution pipeline:
//   locate -> read container -> decrypt -> parse -> lookup -> assemble
//===----------------------------------------------------------------------===//

#pragma once

#include "rage/command_decryptor.hpp"
#include "rage/credential.hpp"
#include "rage/credential_sink.hpp"
#include "rage/decryptor.hpp"
#include "rage/environment.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace duckdb {

class FileSystem;

namespace rage {

//===----------------------------------------------------------------------===//
// CredentialResolver
//
// Synchronous and stateless between calls: every Resolve() builds its own
// buffers and store, and releases them (zeroed) before returning or throwing.
// The first failing stage aborts the pipeline; nothing is retried.
//===----------------------------------------------------------------------===//

class CredentialResolver {
public:
	CredentialResolver(FileSystem &fs, const EnvironmentProvider &env, Decryptor &decryptor,
	                   int64_t max_container_size = DEFAULT_MAX_SECRETS_FILE_SIZE);

	// Throws: AssemblyException, LocationException, DecryptionException,
	// MalformedStoreException, SecretNotFoundException
	CredentialRecord Resolve(const ResolutionRequest &request);

	// Resolve and hand the record to `sink`; returns the sink's status
	std::string ResolveAndRegister(const ResolutionRequest &request, CredentialSink &sink);

private:
	std::vector<uint8_t> ReadContainer(const std::string &path);
	SecureBuffer DecryptContainer(const std::vector<uint8_t> &container, const std::string &identity_path);

	FileSystem &fs_;
	const EnvironmentProvider &env_;
	Decryptor &decryptor_;
	int64_t max_container_size_;
};

}  // namespace rage
}  // namespace duckdb
