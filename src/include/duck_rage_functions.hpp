//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// duck_rage_functions.hpp
//
// duck_rage() table function
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/function/table_function.hpp"
#include "rage/credential.hpp"

namespace duckdb {

//===----------------------------------------------------------------------===//
// duck_rage(db_type, host, port, database, user, secret_key
//           [, secrets_file := VARCHAR] [, identity_file := VARCHAR])
// duck_rage(db_type, host, port, database, user, secrets_file, secret_key, identity_file)
//
// Resolves one password from an age-encrypted secrets file and registers it
// as a temporary secret named duck_rage_<database>. Returns one status row.
//===----------------------------------------------------------------------===//

struct DuckRageBindData : public FunctionData {
	rage::ResolutionRequest request;  // Never holds the password

	unique_ptr<FunctionData> Copy() const override {
		auto result = make_uniq<DuckRageBindData>();
		result->request = request;
		return result;
	}

	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<DuckRageBindData>();
		return request.database_kind == other.request.database_kind && request.host == other.request.host &&
		       request.port == other.request.port && request.database_name == other.request.database_name &&
		       request.connection_user == other.request.connection_user &&
		       request.secret_key == other.request.secret_key &&
		       request.secrets_file_override == other.request.secrets_file_override &&
		       request.identity_file_override == other.request.identity_file_override;
	}
};

struct DuckRageGlobalState : public GlobalTableFunctionState {
	bool done = false;
};

class DuckRageFunction {
public:
	static TableFunctionSet GetFunctionSet();

private:
	static unique_ptr<FunctionData> BindNamed(ClientContext &context, TableFunctionBindInput &input,
	                                          vector<LogicalType> &return_types, vector<string> &names);
	static unique_ptr<FunctionData> BindPositional(ClientContext &context, TableFunctionBindInput &input,
	                                               vector<LogicalType> &return_types, vector<string> &names);
	static unique_ptr<GlobalTableFunctionState> InitGlobal(ClientContext &context, TableFunctionInitInput &input);
	static void Execute(ClientContext &context, TableFunctionInput &input, DataChunk &output);
};

// Usage text appended to argument errors
extern const char *DUCK_RAGE_USAGE;

// Register duck_rage table function
void RegisterDuckRageFunctions(ExtensionLoader &loader);

}  // namespace duckdb
