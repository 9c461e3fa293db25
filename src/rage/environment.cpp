#include "rage/environment.hpp"

#include <cstdlib>

namespace duckdb {
namespace rage {

bool ProcessEnvironment::TryGet(const std::string &name, std::string &result) const {
	const char *value = std::getenv(name.c_str());
	if (!value) {
		return false;
	}
	result = value;
	return true;
}

bool MapEnvironment::TryGet(const std::string &name, std::string &result) const {
	auto it = variables_.find(name);
	if (it == variables_.end()) {
		return false;
	}
	result = it->second;
	return true;
}

static std::string GetNonEmpty(const EnvironmentProvider &env, const char *name) {
	std::string value;
	if (!env.TryGet(name, value)) {
		return "";
	}
	return value;
}

std::string GetUserConfigDirectory(const EnvironmentProvider &env) {
#ifdef _WIN32
	return GetNonEmpty(env, "APPDATA");
#else
	auto home = GetNonEmpty(env, "HOME");
#ifdef __APPLE__
	if (home.empty()) {
		return "";
	}
	return home + "/Library/Application Support";
#else
	// XDG Base Directory: relative values are invalid and must be ignored
	auto xdg = GetNonEmpty(env, "XDG_CONFIG_HOME");
	if (!xdg.empty() && xdg[0] == '/') {
		return xdg;
	}
	if (home.empty()) {
		return "";
	}
	return home + "/.config";
#endif
#endif
}

EnvironmentSnapshot EnvironmentSnapshot::Capture(const EnvironmentProvider &env) {
	EnvironmentSnapshot snapshot;
	snapshot.secrets_file = GetNonEmpty(env, RAGE_SECRETS_FILE_ENV);
	snapshot.identity_file = GetNonEmpty(env, RAGE_IDENTITY_FILE_ENV);
	snapshot.config_dir = GetUserConfigDirectory(env);
	return snapshot;
}

}  // namespace rage
}  // namespace duckdb
