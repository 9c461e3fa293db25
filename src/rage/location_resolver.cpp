//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// location_resolver.cpp
//
// Override / environment / default precedence for the two input files
//===----------------------------------------------------------------------===//

#include "rage/location_resolver.hpp"
#include "rage/rage_exception.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/file_system.hpp"

#include <cstdio>
#include <cstdlib>

// Debug logging controlled by DUCK_RAGE_DEBUG environment variable
static int GetRageLocationDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("DUCK_RAGE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define DUCK_RAGE_LOCATION_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                      \
		if (GetRageLocationDebugLevel() >= lvl)                               \
			fprintf(stderr, "[DUCK_RAGE LOCATION] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace duckdb {
namespace rage {

const char *LocationSourceToString(LocationSource source) {
	switch (source) {
	case LocationSource::NONE:
		return "none";
	case LocationSource::OVERRIDE:
		return "explicit parameter";
	case LocationSource::ENVIRONMENT:
		return "environment";
	case LocationSource::DEFAULT_PATH:
		return "default location";
	}
	return "unknown";
}

ResolvedLocation LocationResolver::Select(const std::string &override_path, const std::string &env_path,
                                          const std::string &config_dir, const char *default_file_name) const {
	ResolvedLocation result;
	if (!override_path.empty()) {
		result.path = override_path;
		result.source = LocationSource::OVERRIDE;
	} else if (!env_path.empty()) {
		result.path = env_path;
		result.source = LocationSource::ENVIRONMENT;
	} else if (!config_dir.empty()) {
		result.path = fs_.JoinPath(fs_.JoinPath(config_dir, RAGE_CONFIG_SUBDIR), default_file_name);
		result.source = LocationSource::DEFAULT_PATH;
	}
	return result;
}

void LocationResolver::CheckReadable(const ResolvedLocation &location, const char *description,
                                     const char *env_name) const {
	if (location.source == LocationSource::NONE) {
		throw LocationException("No %s configured: pass it explicitly, set %s, or make the user configuration "
		                        "directory resolvable (HOME)",
		                        description, env_name);
	}

	DUCK_RAGE_LOCATION_DEBUG_LOG(1, "%s: '%s' (from %s)", description, location.path.c_str(),
	                             LocationSourceToString(location.source));

	// Only local files: the path is also handed to the decryption tool verbatim
	if (FileSystem::IsRemoteFile(location.path)) {
		throw LocationException("Cannot read %s '%s' (from %s): only local files are supported", description,
		                        location.path, LocationSourceToString(location.source));
	}

	if (fs_.DirectoryExists(location.path)) {
		throw LocationException("Cannot read %s '%s' (from %s): path is a directory", description, location.path,
		                        LocationSourceToString(location.source));
	}

	if (!fs_.FileExists(location.path)) {
		throw LocationException("Cannot read %s '%s' (from %s): file does not exist", description, location.path,
		                        LocationSourceToString(location.source));
	}

	try {
		auto handle = fs_.OpenFile(location.path, FileFlags::FILE_FLAGS_READ);
		handle->Close();
	} catch (const std::exception &ex) {
		ErrorData error(ex);
		throw LocationException("Cannot read %s '%s' (from %s): %s", description, location.path,
		                        LocationSourceToString(location.source), error.RawMessage());
	}
}

ResolvedLocations LocationResolver::Resolve(const ResolutionRequest &request, const EnvironmentSnapshot &env) const {
	ResolvedLocations result;
	result.secrets_file =
	    Select(request.secrets_file_override, env.secrets_file, env.config_dir, RAGE_DEFAULT_SECRETS_FILE);
	result.identity_file =
	    Select(request.identity_file_override, env.identity_file, env.config_dir, RAGE_DEFAULT_IDENTITY_FILE);

	CheckReadable(result.secrets_file, "secrets file", RAGE_SECRETS_FILE_ENV);
	CheckReadable(result.identity_file, "identity file", RAGE_IDENTITY_FILE_ENV);
	return result;
}

}  // namespace rage
}  // namespace duckdb
