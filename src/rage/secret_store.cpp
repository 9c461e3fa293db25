#include "rage/secret_store.hpp"
#include "rage/rage_exception.hpp"

#include "yyjson.hpp"

#include <cstdio>
#include <cstdlib>
#include <utility>

using namespace duckdb_yyjson;  // NOLINT

// Debug logging controlled by DUCK_RAGE_DEBUG environment variable
static int GetRageStoreDebugLevel() {
	static int level = -1;
	if (level == -1) {
		const char *env = std::getenv("DUCK_RAGE_DEBUG");
		level = env ? std::atoi(env) : 0;
	}
	return level;
}

#define DUCK_RAGE_STORE_DEBUG_LOG(lvl, fmt, ...)                           \
	do {                                                                   \
		if (GetRageStoreDebugLevel() >= lvl)                               \
			fprintf(stderr, "[DUCK_RAGE STORE] " fmt "\n", ##__VA_ARGS__); \
	} while (0)

namespace duckdb {
namespace rage {

namespace {

// Frees the document on every exit path. With in-situ parsing the document
// only holds offsets into the caller's buffer, not string contents.
struct YyjsonDocGuard {
	explicit YyjsonDocGuard(yyjson_doc *doc_p) : doc(doc_p) {}
	~YyjsonDocGuard() {
		if (doc) {
			yyjson_doc_free(doc);
		}
	}
	YyjsonDocGuard(const YyjsonDocGuard &) = delete;
	YyjsonDocGuard &operator=(const YyjsonDocGuard &) = delete;

	yyjson_doc *doc;
};

}  // namespace

SecretStore SecretStore::Parse(SecureBuffer cleartext) {
	// In-situ parsing needs zeroed padding after the content
	auto content_size = cleartext.GetSize();
	cleartext.Reserve(content_size + YYJSON_PADDING_SIZE);

	yyjson_read_err err;
	yyjson_read_flag flags = YYJSON_READ_INSITU;
	YyjsonDocGuard guard(yyjson_read_opts(cleartext.GetData(), content_size, flags, nullptr, &err));
	if (!guard.doc) {
		throw MalformedStoreException("Secrets file is not valid JSON: %s at byte %llu", std::string(err.msg),
		                              (unsigned long long)err.pos);
	}

	auto root = yyjson_doc_get_root(guard.doc);
	if (!root || !yyjson_is_obj(root)) {
		throw MalformedStoreException("Secrets file must contain a JSON object of string values, got %s",
		                              std::string(root ? yyjson_get_type_desc(root) : "nothing"));
	}

	SecretStore store;
	yyjson_obj_iter iter;
	yyjson_obj_iter_init(root, &iter);
	yyjson_val *key;
	while ((key = yyjson_obj_iter_next(&iter))) {
		auto value = yyjson_obj_iter_get_val(key);
		std::string name(yyjson_get_str(key), yyjson_get_len(key));
		if (!yyjson_is_str(value)) {
			throw MalformedStoreException("Value for key '%s' must be a JSON string, got %s", name,
			                              std::string(yyjson_get_type_desc(value)));
		}
		auto inserted = store.entries_.emplace(name, SecureString(yyjson_get_str(value), yyjson_get_len(value)));
		if (!inserted.second) {
			throw MalformedStoreException("Duplicate key '%s' in secrets file", name);
		}
	}

	DUCK_RAGE_STORE_DEBUG_LOG(1, "parsed secrets store with %llu entries", (unsigned long long)store.entries_.size());
	return store;
}

const SecureString &SecretStore::Lookup(const std::string &key) const {
	auto it = entries_.find(key);
	if (it == entries_.end()) {
		throw SecretNotFoundException("Key '%s' not found in secrets file", key);
	}
	return it->second;
}

SecureString SecretStore::Extract(const std::string &key) {
	auto it = entries_.find(key);
	if (it == entries_.end()) {
		throw SecretNotFoundException("Key '%s' not found in secrets file", key);
	}
	auto value = std::move(it->second);
	entries_.erase(it);
	return value;
}

}  // namespace rage
}  // namespace duckdb
