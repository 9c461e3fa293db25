//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/environment.hpp
//
// Injected access to process environment variables
//===----------------------------------------------------------------------===//

#pragma once

#include <string>
#include <unordered_map>

namespace duckdb {
namespace rage {

// Environment variable names
constexpr const char *RAGE_SECRETS_FILE_ENV = "RAGE_SECRETS_FILE";
constexpr const char *RAGE_IDENTITY_FILE_ENV = "RAGE_IDENTITY_FILE";

class EnvironmentProvider {
public:
	virtual ~EnvironmentProvider() = default;

	// Returns false if the variable is not set
	virtual bool TryGet(const std::string &name, std::string &result) const = 0;
};

// Reads the real process environment
class ProcessEnvironment : public EnvironmentProvider {
public:
	bool TryGet(const std::string &name, std::string &result) const override;
};

// Fixed variable map, used by tests
class MapEnvironment : public EnvironmentProvider {
public:
	MapEnvironment() = default;
	explicit MapEnvironment(std::unordered_map<std::string, std::string> variables)
	    : variables_(std::move(variables)) {
	}

	void Set(const std::string &name, const std::string &value) {
		variables_[name] = value;
	}

	bool TryGet(const std::string &name, std::string &result) const override;

private:
	std::unordered_map<std::string, std::string> variables_;
};

//===----------------------------------------------------------------------===//
// EnvironmentSnapshot - everything resolution needs, read once
//===----------------------------------------------------------------------===//

struct EnvironmentSnapshot {
	// Empty when the variable is unset or set to ""
	std::string secrets_file;
	std::string identity_file;
	// User configuration directory; empty when it cannot be determined
	std::string config_dir;

	static EnvironmentSnapshot Capture(const EnvironmentProvider &env);
};

// Platform user configuration directory:
//   Linux/Unix: $XDG_CONFIG_HOME (if absolute) or $HOME/.config
//   macOS:      $HOME/Library/Application Support
//   Windows:    %APPDATA%
std::string GetUserConfigDirectory(const EnvironmentProvider &env);

}  // namespace rage
}  // namespace duckdb
