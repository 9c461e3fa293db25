// Unit tests for secrets/identity file location precedence
// Uses real temporary files through LocalFileSystem

#include "catch.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/local_file_system.hpp"
#include "rage/location_resolver.hpp"
#include "rage/rage_exception.hpp"
#include "test_helpers.hpp"

using namespace duckdb;
using namespace duckdb::rage;
using duckdb::rage::testing::TempDir;

static ResolutionRequest MakeRequest() {
	ResolutionRequest request;
	request.host = "db.example.com";
	request.port = 5432;
	request.database_name = "analytics";
	request.connection_user = "reporter";
	request.secret_key = "analytics_password";
	return request;
}

// Environment whose config directory is <tmp>/config, plus both default files written there
static MapEnvironment MakeEnvironmentWithDefaults(const TempDir &dir) {
	MapEnvironment env;
	env.Set("HOME", dir.Path());
	env.Set("XDG_CONFIG_HOME", dir.Join("config"));
	env.Set("APPDATA", dir.Join("config"));
	return env;
}

static void WriteDefaultFiles(const TempDir &dir, const std::string &config_dir) {
	auto relative = config_dir.substr(dir.Path().size() + 1);
	dir.WriteFile(relative + "/duck-rage/secrets.age", "default-container");
	dir.WriteFile(relative + "/duck-rage/identity.txt", "default-identity");
}

TEST_CASE("LocationResolver - Tier selection", "[duck_rage][location]") {
	LocalFileSystem fs;
	LocationResolver resolver(fs);

	SECTION("Override wins over environment and default") {
		auto loc = resolver.Select("/explicit/s.age", "/env/s.age", "/home/u/.config", RAGE_DEFAULT_SECRETS_FILE);
		REQUIRE(loc.path == "/explicit/s.age");
		REQUIRE(loc.source == LocationSource::OVERRIDE);
	}

	SECTION("Environment wins over default") {
		auto loc = resolver.Select("", "/env/s.age", "/home/u/.config", RAGE_DEFAULT_SECRETS_FILE);
		REQUIRE(loc.path == "/env/s.age");
		REQUIRE(loc.source == LocationSource::ENVIRONMENT);
	}

	SECTION("Default joins config dir, subdirectory and file name") {
		auto loc = resolver.Select("", "", "/home/u/.config", RAGE_DEFAULT_IDENTITY_FILE);
		REQUIRE(loc.path == fs.JoinPath(fs.JoinPath("/home/u/.config", "duck-rage"), "identity.txt"));
		REQUIRE(loc.source == LocationSource::DEFAULT_PATH);
	}

	SECTION("No tier populated") {
		auto loc = resolver.Select("", "", "", RAGE_DEFAULT_SECRETS_FILE);
		REQUIRE(loc.path.empty());
		REQUIRE(loc.source == LocationSource::NONE);
	}
}

TEST_CASE("EnvironmentSnapshot - Empty values count as unset", "[duck_rage][location]") {
	MapEnvironment env;
	env.Set(RAGE_SECRETS_FILE_ENV, "");
	env.Set(RAGE_IDENTITY_FILE_ENV, "/keys/id.txt");
	env.Set("HOME", "");
	env.Set("XDG_CONFIG_HOME", "");
	env.Set("APPDATA", "");

	auto snapshot = EnvironmentSnapshot::Capture(env);
	REQUIRE(snapshot.secrets_file.empty());
	REQUIRE(snapshot.identity_file == "/keys/id.txt");
	REQUIRE(snapshot.config_dir.empty());
}

#if !defined(_WIN32) && !defined(__APPLE__)
TEST_CASE("GetUserConfigDirectory - XDG handling", "[duck_rage][location]") {
	MapEnvironment env;
	env.Set("HOME", "/home/alice");

	SECTION("Falls back to HOME/.config") {
		REQUIRE(GetUserConfigDirectory(env) == "/home/alice/.config");
	}

	SECTION("Absolute XDG_CONFIG_HOME is used") {
		env.Set("XDG_CONFIG_HOME", "/srv/config");
		REQUIRE(GetUserConfigDirectory(env) == "/srv/config");
	}

	SECTION("Relative XDG_CONFIG_HOME is ignored") {
		env.Set("XDG_CONFIG_HOME", "relative/config");
		REQUIRE(GetUserConfigDirectory(env) == "/home/alice/.config");
	}
}
#endif

TEST_CASE("LocationResolver - Resolve against real files", "[duck_rage][location]") {
	TempDir dir;
	LocalFileSystem fs;
	LocationResolver resolver(fs);
	auto env = MakeEnvironmentWithDefaults(dir);
	auto config_dir = GetUserConfigDirectory(env);
	REQUIRE_FALSE(config_dir.empty());
	WriteDefaultFiles(dir, config_dir);

	auto request = MakeRequest();

	SECTION("Defaults are found when nothing else is set") {
		auto locations = resolver.Resolve(request, EnvironmentSnapshot::Capture(env));
		REQUIRE(locations.secrets_file.source == LocationSource::DEFAULT_PATH);
		REQUIRE(locations.identity_file.source == LocationSource::DEFAULT_PATH);
	}

	SECTION("Override beats environment and default") {
		auto override_path = dir.WriteFile("explicit.age", "explicit");
		env.Set(RAGE_SECRETS_FILE_ENV, dir.WriteFile("env.age", "env"));
		request.secrets_file_override = override_path;

		auto locations = resolver.Resolve(request, EnvironmentSnapshot::Capture(env));
		REQUIRE(locations.secrets_file.path == override_path);
		REQUIRE(locations.secrets_file.source == LocationSource::OVERRIDE);
		REQUIRE(locations.identity_file.source == LocationSource::DEFAULT_PATH);
	}

	SECTION("Environment beats default") {
		auto env_identity = dir.WriteFile("env_identity.txt", "identity");
		env.Set(RAGE_IDENTITY_FILE_ENV, env_identity);

		auto locations = resolver.Resolve(request, EnvironmentSnapshot::Capture(env));
		REQUIRE(locations.identity_file.path == env_identity);
		REQUIRE(locations.identity_file.source == LocationSource::ENVIRONMENT);
	}

	SECTION("Missing override does not fall through to existing files") {
		env.Set(RAGE_SECRETS_FILE_ENV, dir.WriteFile("env.age", "env"));
		request.secrets_file_override = dir.Join("does_not_exist.age");

		REQUIRE_THROWS_AS(resolver.Resolve(request, EnvironmentSnapshot::Capture(env)), LocationException);
	}

	SECTION("Directory is not a readable file") {
		request.secrets_file_override = dir.Path();
		REQUIRE_THROWS_AS(resolver.Resolve(request, EnvironmentSnapshot::Capture(env)), LocationException);
	}

	SECTION("Remote paths are rejected") {
		request.secrets_file_override = "http://example.com/secrets.age";
		REQUIRE_THROWS_AS(resolver.Resolve(request, EnvironmentSnapshot::Capture(env)), LocationException);

		request.secrets_file_override.clear();
		env.Set(RAGE_IDENTITY_FILE_ENV, "s3://bucket/identity.txt");
		REQUIRE_THROWS_AS(resolver.Resolve(request, EnvironmentSnapshot::Capture(env)), LocationException);
	}

	SECTION("Missing environment path does not fall through to default") {
		env.Set(RAGE_IDENTITY_FILE_ENV, dir.Join("missing_identity.txt"));
		REQUIRE_THROWS_AS(resolver.Resolve(request, EnvironmentSnapshot::Capture(env)), LocationException);
	}
}

TEST_CASE("LocationResolver - Nothing configured", "[duck_rage][location]") {
	LocalFileSystem fs;
	LocationResolver resolver(fs);
	MapEnvironment env;

	try {
		resolver.Resolve(MakeRequest(), EnvironmentSnapshot::Capture(env));
		FAIL("expected LocationException");
	} catch (const LocationException &ex) {
		REQUIRE(ex.GetKind() == RageErrorKind::LOCATION);
		auto message = ErrorData(ex).RawMessage();
		REQUIRE(message.find("[location]") != std::string::npos);
		REQUIRE(message.find("RAGE_SECRETS_FILE") != std::string::npos);
	}
}
