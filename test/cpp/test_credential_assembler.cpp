#include "catch.hpp"
#include "duckdb/common/exception.hpp"
#include "rage/credential.hpp"
#include "rage/rage_exception.hpp"

using namespace duckdb;
using namespace duckdb::rage;

static ResolutionRequest MakeRequest() {
	ResolutionRequest request;
	request.database_kind = DatabaseKind::POSTGRES;
	request.host = "db.example.com";
	request.port = 5432;
	request.database_name = "prod_db";
	request.connection_user = "admin";
	request.secret_key = "prod_db";
	return request;
}

TEST_CASE("ParseDatabaseKind - Accepted spellings", "[duck_rage][credential]") {
	REQUIRE(ParseDatabaseKind("postgres") == DatabaseKind::POSTGRES);
	REQUIRE(ParseDatabaseKind("PostgreSQL") == DatabaseKind::POSTGRES);
	REQUIRE(ParseDatabaseKind("MYSQL") == DatabaseKind::MYSQL);
	REQUIRE_THROWS_AS(ParseDatabaseKind("sqlite"), InvalidInputException);
	REQUIRE_THROWS_AS(ParseDatabaseKind(""), InvalidInputException);

	REQUIRE(std::string(DatabaseKindToString(DatabaseKind::POSTGRES)) == "postgres");
	REQUIRE(std::string(DatabaseKindToString(DatabaseKind::MYSQL)) == "mysql");
}

TEST_CASE("DeriveSecretName - Prefix and lower-casing", "[duck_rage][credential]") {
	REQUIRE(DeriveSecretName("prod_db") == "duck_rage_prod_db");
	REQUIRE(DeriveSecretName("Prod_DB") == "duck_rage_prod_db");
	// Not sanitized: characters pass through unchanged
	REQUIRE(DeriveSecretName("my-db.v2") == "duck_rage_my-db.v2");
}

TEST_CASE("AssembleCredential - Record contents", "[duck_rage][credential]") {
	auto request = MakeRequest();
	auto record = AssembleCredential(request, SecureString(std::string("s3cr3t")));

	REQUIRE(record.secret_name == "duck_rage_prod_db");
	REQUIRE(record.database_kind == DatabaseKind::POSTGRES);
	REQUIRE(record.host == "db.example.com");
	REQUIRE(record.port == 5432);
	REQUIRE(record.database_name == "prod_db");
	REQUIRE(record.connection_user == "admin");
	REQUIRE(record.secret_value.GetString() == "s3cr3t");
}

TEST_CASE("AssembleCredential - Secret name depends only on database", "[duck_rage][credential]") {
	auto first = MakeRequest();
	auto second = MakeRequest();
	second.database_kind = DatabaseKind::MYSQL;
	second.host = "other.example.com";
	second.port = 3306;
	second.connection_user = "someone_else";
	second.secret_key = "another_key";

	auto a = AssembleCredential(first, SecureString(std::string("x")));
	auto b = AssembleCredential(second, SecureString(std::string("y")));
	REQUIRE(a.secret_name == b.secret_name);
}

TEST_CASE("ResolutionRequest - Validate", "[duck_rage][credential]") {
	auto request = MakeRequest();
	REQUIRE_NOTHROW(request.Validate());

	SECTION("Empty required fields") {
		auto empty_host = request;
		empty_host.host.clear();
		REQUIRE_THROWS_AS(empty_host.Validate(), AssemblyException);

		auto empty_db = request;
		empty_db.database_name.clear();
		REQUIRE_THROWS_AS(empty_db.Validate(), AssemblyException);

		auto empty_user = request;
		empty_user.connection_user.clear();
		REQUIRE_THROWS_AS(empty_user.Validate(), AssemblyException);

		auto empty_key = request;
		empty_key.secret_key.clear();
		REQUIRE_THROWS_AS(empty_key.Validate(), AssemblyException);
	}

	SECTION("Port range") {
		request.port = 0;
		REQUIRE_THROWS_AS(request.Validate(), AssemblyException);
		request.port = 65536;
		REQUIRE_THROWS_AS(request.Validate(), AssemblyException);
		request.port = 65535;
		REQUIRE_NOTHROW(request.Validate());
		request.port = 1;
		REQUIRE_NOTHROW(request.Validate());
	}

	SECTION("Assembly rejects invalid requests") {
		request.host.clear();
		REQUIRE_THROWS_AS(AssembleCredential(request, SecureString(std::string("x"))), AssemblyException);
	}
}
