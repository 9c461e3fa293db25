#include "duck_rage_settings.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/main/config.hpp"

namespace duckdb {

//===----------------------------------------------------------------------===//
// Setting Validators
//===----------------------------------------------------------------------===//

static void ValidatePositive(ClientContext &context, SetScope scope, Value &parameter) {
	auto val = parameter.GetValue<int64_t>();
	if (val < 1) {
		throw InvalidInputException("Value must be >= 1, got: %lld", val);
	}
}

static void ValidateCommand(ClientContext &context, SetScope scope, Value &parameter) {
	auto command = parameter.ToString();
	StringUtil::Trim(command);
	if (command.empty()) {
		throw InvalidInputException("duck_rage_decrypt_command cannot be empty");
	}
	if (!rage::IsAllowedDecryptCommand(command)) {
		throw InvalidInputException("duck_rage_decrypt_command must name the rage or age executable, got: '%s'",
		                            command);
	}
	parameter = Value(command);
}

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

void RegisterDuckRageSettings(ExtensionLoader &loader) {
	auto &db = loader.GetDatabaseInstance();
	auto &config = DBConfig::GetConfig(db);

	// duck_rage_decrypt_command - age-compatible tool run as `<cmd> -d -i <identity>`
	config.AddExtensionOption("duck_rage_decrypt_command",
	                          "Age-compatible command used to decrypt secrets files (invoked as <cmd> -d -i <identity>)",
	                          LogicalType::VARCHAR, Value(rage::DEFAULT_DECRYPT_COMMAND), ValidateCommand,
	                          SetScope::GLOBAL);

	// duck_rage_max_secrets_file_size - Cap on encrypted and decrypted sizes
	config.AddExtensionOption("duck_rage_max_secrets_file_size",
	                          "Maximum size in bytes of a secrets file, encrypted or decrypted", LogicalType::BIGINT,
	                          Value::BIGINT(rage::DEFAULT_MAX_SECRETS_FILE_SIZE), ValidatePositive, SetScope::GLOBAL);
}

//===----------------------------------------------------------------------===//
// Loading
//===----------------------------------------------------------------------===//

DuckRageConfig LoadDuckRageConfig(ClientContext &context) {
	DuckRageConfig config;
	Value val;

	if (context.TryGetCurrentSetting("duck_rage_decrypt_command", val) && !val.IsNull()) {
		config.decrypt_command = val.ToString();
	}

	if (context.TryGetCurrentSetting("duck_rage_max_secrets_file_size", val) && !val.IsNull()) {
		config.max_secrets_file_size = val.GetValue<int64_t>();
	}

	return config;
}

}  // namespace duckdb
