#include "duck_rage_functions.hpp"
#include "duck_rage_secret.hpp"
#include "duck_rage_settings.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/main/config.hpp"
#include "rage/command_decryptor.hpp"
#include "rage/credential_resolver.hpp"
#include "rage/environment.hpp"

namespace duckdb {

const char *DUCK_RAGE_USAGE =
    "Usage: duck_rage(db_type, host, port, database, user, secret_key "
    "[, secrets_file := VARCHAR] [, identity_file := VARCHAR]) or "
    "duck_rage(db_type, host, port, database, user, secrets_file, secret_key, identity_file)";

//===----------------------------------------------------------------------===//
// Argument helpers
//===----------------------------------------------------------------------===//

static std::string GetRequiredString(const TableFunctionBindInput &input, idx_t index, const char *name) {
	auto &value = input.inputs[index];
	if (value.IsNull()) {
		throw InvalidInputException("duck_rage: argument '%s' cannot be NULL. %s", name, DUCK_RAGE_USAGE);
	}
	auto result = value.ToString();
	if (result.empty()) {
		throw InvalidInputException("duck_rage: argument '%s' cannot be empty. %s", name, DUCK_RAGE_USAGE);
	}
	return result;
}

static std::string GetOptionalString(const Value &value) {
	if (value.IsNull()) {
		return std::string();
	}
	return value.ToString();
}

// db_type, host, port, database, user are shared by both signatures
static void BindConnectionArguments(const TableFunctionBindInput &input, rage::ResolutionRequest &request) {
	auto db_type = GetRequiredString(input, 0, "db_type");
	try {
		request.database_kind = rage::ParseDatabaseKind(db_type);
	} catch (const InvalidInputException &ex) {
		throw InvalidInputException("duck_rage: %s. %s", ErrorData(ex).RawMessage(), DUCK_RAGE_USAGE);
	}

	request.host = GetRequiredString(input, 1, "host");

	auto &port_value = input.inputs[2];
	if (port_value.IsNull()) {
		throw InvalidInputException("duck_rage: argument 'port' cannot be NULL. %s", DUCK_RAGE_USAGE);
	}
	auto port = port_value.GetValue<int64_t>();
	if (port < 1 || port > 65535) {
		throw InvalidInputException("duck_rage: port must be between 1 and 65535. Got: %lld. %s", port,
		                            DUCK_RAGE_USAGE);
	}
	request.port = static_cast<int32_t>(port);

	request.database_name = GetRequiredString(input, 3, "database");
	request.connection_user = GetRequiredString(input, 4, "user");
}

static void SetStatusColumn(vector<LogicalType> &return_types, vector<string> &names) {
	names.emplace_back("status");
	return_types.emplace_back(LogicalType::VARCHAR);
}

//===----------------------------------------------------------------------===//
// Bind
//===----------------------------------------------------------------------===//

unique_ptr<FunctionData> DuckRageFunction::BindNamed(ClientContext &context, TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<DuckRageBindData>();
	auto &request = bind_data->request;

	BindConnectionArguments(input, request);
	request.secret_key = GetRequiredString(input, 5, "secret_key");

	auto it = input.named_parameters.find("secrets_file");
	if (it != input.named_parameters.end()) {
		request.secrets_file_override = GetOptionalString(it->second);
	}
	it = input.named_parameters.find("identity_file");
	if (it != input.named_parameters.end()) {
		request.identity_file_override = GetOptionalString(it->second);
	}

	SetStatusColumn(return_types, names);
	return std::move(bind_data);
}

unique_ptr<FunctionData> DuckRageFunction::BindPositional(ClientContext &context, TableFunctionBindInput &input,
                                                          vector<LogicalType> &return_types, vector<string> &names) {
	auto bind_data = make_uniq<DuckRageBindData>();
	auto &request = bind_data->request;

	BindConnectionArguments(input, request);
	// 8-argument form: secrets_file comes before secret_key
	request.secrets_file_override = GetOptionalString(input.inputs[5]);
	request.secret_key = GetRequiredString(input, 6, "secret_key");
	request.identity_file_override = GetOptionalString(input.inputs[7]);

	SetStatusColumn(return_types, names);
	return std::move(bind_data);
}

//===----------------------------------------------------------------------===//
// Execute
//===----------------------------------------------------------------------===//

unique_ptr<GlobalTableFunctionState> DuckRageFunction::InitGlobal(ClientContext &context,
                                                                  TableFunctionInitInput &input) {
	return make_uniq<DuckRageGlobalState>();
}

void DuckRageFunction::Execute(ClientContext &context, TableFunctionInput &input, DataChunk &output) {
	auto &gstate = input.global_state->Cast<DuckRageGlobalState>();
	if (gstate.done) {
		output.SetCardinality(0);
		return;
	}
	gstate.done = true;

	// Reads local files and runs an external program
	if (!DBConfig::GetConfig(context).options.enable_external_access) {
		throw PermissionException("duck_rage is disabled because enable_external_access is set to false");
	}

	auto &bind_data = input.bind_data->Cast<DuckRageBindData>();
	auto config = LoadDuckRageConfig(context);
	if (!rage::IsAllowedDecryptCommand(config.decrypt_command)) {
		throw PermissionException("duck_rage_decrypt_command '%s' is not the rage or age executable",
		                          config.decrypt_command);
	}

	auto &fs = FileSystem::GetFileSystem(context);
	rage::ProcessEnvironment env;
	rage::CommandDecryptor decryptor(config.decrypt_command, config.max_secrets_file_size);
	rage::CredentialResolver resolver(fs, env, decryptor, config.max_secrets_file_size);
	SecretManagerSink sink(context);

	auto status = resolver.ResolveAndRegister(bind_data.request, sink);

	output.data[0].SetValue(0, Value(status));
	output.SetCardinality(1);
}

//===----------------------------------------------------------------------===//
// Registration
//===----------------------------------------------------------------------===//

TableFunctionSet DuckRageFunction::GetFunctionSet() {
	TableFunctionSet set("duck_rage");

	TableFunction named_func("duck_rage",
	                         {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::INTEGER, LogicalType::VARCHAR,
	                          LogicalType::VARCHAR, LogicalType::VARCHAR},
	                         Execute, BindNamed, InitGlobal);
	named_func.named_parameters["secrets_file"] = LogicalType::VARCHAR;
	named_func.named_parameters["identity_file"] = LogicalType::VARCHAR;
	set.AddFunction(named_func);

	TableFunction positional_func("duck_rage",
	                              {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::INTEGER,
	                               LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                               LogicalType::VARCHAR, LogicalType::VARCHAR},
	                              Execute, BindPositional, InitGlobal);
	set.AddFunction(positional_func);

	return set;
}

void RegisterDuckRageFunctions(ExtensionLoader &loader) {
	loader.RegisterFunction(DuckRageFunction::GetFunctionSet());
}

}  // namespace duckdb
