//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/location_resolver.hpp
//
// Locates the encrypted secrets container and the decryption identity
//===----------------------------------------------------------------------===//

#pragma once

#include "rage/credential.hpp"
#include "rage/environment.hpp"

#include <string>

namespace duckdb {

class FileSystem;

namespace rage {

// Default locations under the user configuration directory
constexpr const char *RAGE_CONFIG_SUBDIR = "duck-rage";
constexpr const char *RAGE_DEFAULT_SECRETS_FILE = "secrets.age";
constexpr const char *RAGE_DEFAULT_IDENTITY_FILE = "identity.txt";

// Which precedence tier produced a path
enum class LocationSource : uint8_t { NONE, OVERRIDE, ENVIRONMENT, DEFAULT_PATH };

const char *LocationSourceToString(LocationSource source);

struct ResolvedLocation {
	std::string path;
	LocationSource source = LocationSource::NONE;
};

struct ResolvedLocations {
	ResolvedLocation secrets_file;
	ResolvedLocation identity_file;
};

//===----------------------------------------------------------------------===//
// LocationResolver
//
// Precedence per path: request override > environment variable > default.
// The first populated tier wins outright; a missing or unreadable file there
// is an error, never a reason to try the next tier.
//===----------------------------------------------------------------------===//

class LocationResolver {
public:
	explicit LocationResolver(FileSystem &fs) : fs_(fs) {
	}

	// Throws: LocationException if no tier yields a path, or a chosen path
	// does not exist or is not readable
	ResolvedLocations Resolve(const ResolutionRequest &request, const EnvironmentSnapshot &env) const;

	// Pure tier selection without filesystem checks.
	// Returns source NONE when every tier is empty.
	ResolvedLocation Select(const std::string &override_path, const std::string &env_path,
	                        const std::string &config_dir, const char *default_file_name) const;

private:
	void CheckReadable(const ResolvedLocation &location, const char *description, const char *env_name) const;

	FileSystem &fs_;
};

}  // namespace rage
}  // namespace duckdb
