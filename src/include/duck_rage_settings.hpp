#pragma once

#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/main/client_context.hpp"
#include "rage/command_decryptor.hpp"

namespace duckdb {

// Decryption configuration structure
// Loaded from DuckDB settings at runtime
struct DuckRageConfig {
	std::string decrypt_command = rage::DEFAULT_DECRYPT_COMMAND;
	int64_t max_secrets_file_size = rage::DEFAULT_MAX_SECRETS_FILE_SIZE;
};

// Register duck_rage settings with DuckDB
void RegisterDuckRageSettings(ExtensionLoader &loader);

// Load current configuration from context settings
DuckRageConfig LoadDuckRageConfig(ClientContext &context);

}  // namespace duckdb
