//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/secret_store.hpp
//
// Flat name -> value mapping parsed from decrypted cleartext
//===----------------------------------------------------------------------===//

#pragma once

#include "rage/secure_buffer.hpp"

#include <string>
#include <unordered_map>

namespace duckdb {
namespace rage {

//===----------------------------------------------------------------------===//
// SecretStore
//
// Accepted format: one UTF-8 JSON object whose members are all strings.
// Nested objects, arrays, numbers, booleans, null, duplicate names and
// non-object documents are rejected. Lookups are exact and case-sensitive.
// Built fresh for each resolution; never cached or written back.
//===----------------------------------------------------------------------===//

class SecretStore {
public:
	SecretStore() = default;
	SecretStore(const SecretStore &) = delete;
	SecretStore &operator=(const SecretStore &) = delete;
	SecretStore(SecretStore &&) = default;
	SecretStore &operator=(SecretStore &&) = default;

	// Parses in place over `cleartext`, which is zeroed when this call returns
	// Throws: MalformedStoreException
	static SecretStore Parse(SecureBuffer cleartext);

	// Throws: SecretNotFoundException if `key` is absent
	const SecureString &Lookup(const std::string &key) const;

	// Lookup that moves the value out of the store
	// Throws: SecretNotFoundException if `key` is absent
	SecureString Extract(const std::string &key);

	bool Contains(const std::string &key) const {
		return entries_.find(key) != entries_.end();
	}
	idx_t Size() const {
		return entries_.size();
	}

private:
	std::unordered_map<std::string, SecureString> entries_;
};

}  // namespace rage
}  // namespace duckdb
