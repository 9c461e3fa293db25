#include "catch.hpp"
#include "duckdb/common/error_data.hpp"
#include "rage/rage_exception.hpp"
#include "rage/secret_store.hpp"

using namespace duckdb;
using namespace duckdb::rage;

static SecretStore ParseText(const std::string &text) {
	return SecretStore::Parse(SecureBuffer(text.data(), text.size()));
}

static std::string ParseError(const std::string &text) {
	try {
		ParseText(text);
	} catch (const MalformedStoreException &ex) {
		return ErrorData(ex).RawMessage();
	}
	return std::string();
}

TEST_CASE("SecretStore - Valid documents", "[duck_rage][secret_store]") {
	SECTION("Flat object of strings") {
		auto store = ParseText(R"({"prod_db": "p@ss", "staging_db": "other"})");
		REQUIRE(store.Size() == 2);
		REQUIRE(store.Contains("prod_db"));
		REQUIRE(store.Lookup("prod_db").GetString() == "p@ss");
		REQUIRE(store.Lookup("staging_db").GetString() == "other");
	}

	SECTION("Empty object") {
		auto store = ParseText("{}");
		REQUIRE(store.Size() == 0);
	}

	SECTION("Escapes and unicode are decoded") {
		auto store = ParseText(R"({"k": "a\"b\\cé"})");
		REQUIRE(store.Lookup("k").GetString() == "a\"b\\c\xc3\xa9");
	}

	SECTION("Empty string value is kept") {
		auto store = ParseText(R"({"blank": ""})");
		REQUIRE(store.Contains("blank"));
		REQUIRE(store.Lookup("blank").Empty());
	}
}

TEST_CASE("SecretStore - Lookup", "[duck_rage][secret_store]") {
	auto store = ParseText(R"({"Prod": "one", "prod": "two"})");

	SECTION("Keys are case-sensitive") {
		REQUIRE(store.Lookup("Prod").GetString() == "one");
		REQUIRE(store.Lookup("prod").GetString() == "two");
		REQUIRE_THROWS_AS(store.Lookup("PROD"), SecretNotFoundException);
	}

	SECTION("Missing key names the key") {
		try {
			store.Lookup("missing_key");
			FAIL("expected SecretNotFoundException");
		} catch (const SecretNotFoundException &ex) {
			REQUIRE(ex.GetKind() == RageErrorKind::SECRET_NOT_FOUND);
			REQUIRE(ErrorData(ex).RawMessage().find("missing_key") != std::string::npos);
		}
	}

	SECTION("Extract moves the value out") {
		auto value = store.Extract("prod");
		REQUIRE(value.GetString() == "two");
		REQUIRE_FALSE(store.Contains("prod"));
		REQUIRE_THROWS_AS(store.Extract("prod"), SecretNotFoundException);
	}
}

TEST_CASE("SecretStore - Malformed documents", "[duck_rage][secret_store]") {
	SECTION("Invalid JSON") {
		REQUIRE_THROWS_AS(ParseText("{not json"), MalformedStoreException);
		REQUIRE_THROWS_AS(ParseText(""), MalformedStoreException);
	}

	SECTION("Root must be an object") {
		REQUIRE_THROWS_AS(ParseText(R"(["a", "b"])"), MalformedStoreException);
		REQUIRE_THROWS_AS(ParseText(R"("just a string")"), MalformedStoreException);
	}

	SECTION("Non-string values are rejected") {
		REQUIRE_THROWS_AS(ParseText(R"({"port": 5432})"), MalformedStoreException);
		REQUIRE_THROWS_AS(ParseText(R"({"flag": true})"), MalformedStoreException);
		REQUIRE_THROWS_AS(ParseText(R"({"nothing": null})"), MalformedStoreException);
		REQUIRE_THROWS_AS(ParseText(R"({"list": ["a"]})"), MalformedStoreException);
		REQUIRE_THROWS_AS(ParseText(R"({"nested": {"a": "b"}})"), MalformedStoreException);
	}

	SECTION("Invalid UTF-8 is rejected") {
		REQUIRE_THROWS_AS(ParseText("{\"k\": \"\xff\"}"), MalformedStoreException);
		REQUIRE_THROWS_AS(ParseText("{\"\xc3\": \"v\"}"), MalformedStoreException);
	}

	SECTION("Duplicate keys are rejected") {
		auto message = ParseError(R"({"db": "first", "db": "second"})");
		REQUIRE(message.find("Duplicate key 'db'") != std::string::npos);
	}
}

TEST_CASE("SecretStore - Errors never echo values", "[duck_rage][secret_store]") {
	SECTION("Wrong-typed sibling") {
		auto message = ParseError(R"({"good": "TopSecretValue1", "bad": 42})");
		REQUIRE_FALSE(message.empty());
		REQUIRE(message.find("'bad'") != std::string::npos);
		REQUIRE(message.find("TopSecretValue1") == std::string::npos);
	}

	SECTION("Duplicate key") {
		auto message = ParseError(R"({"db": "TopSecretValue2", "db": "TopSecretValue3"})");
		REQUIRE(message.find("TopSecretValue2") == std::string::npos);
		REQUIRE(message.find("TopSecretValue3") == std::string::npos);
	}

	SECTION("Syntax error") {
		auto message = ParseError(R"({"db": "TopSecretValue4" "x"})");
		REQUIRE_FALSE(message.empty());
		REQUIRE(message.find("TopSecretValue4") == std::string::npos);
	}
}
