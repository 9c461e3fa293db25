#include "duck_rage_extension.hpp"
#include "duck_rage_functions.hpp"
#include "duck_rage_settings.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

// Extension version string
static const char *GetDuckRageExtensionVersion() {
#ifdef DUCK_RAGE_VERSION
	return DUCK_RAGE_VERSION;
#else
	return "unknown";
#endif
}

static void DuckRageVersionFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto version = GetDuckRageExtensionVersion();
	result.SetVectorType(VectorType::CONSTANT_VECTOR);
	ConstantVector::GetData<string_t>(result)[0] = StringVector::AddString(result, version);
}

// Internal function to register extension functionality
static void LoadInternal(ExtensionLoader &loader) {
	// 1. Register settings (decrypt command, size cap)
	RegisterDuckRageSettings(loader);

	// 2. Register duck_rage table function
	RegisterDuckRageFunctions(loader);

	// 3. Register utility functions (duck_rage_version)
	auto version_func = ScalarFunction("duck_rage_version", {}, LogicalType::VARCHAR, DuckRageVersionFunction);
	loader.RegisterFunction(version_func);
}

// Extension class methods
void DuckRageExtension::Load(ExtensionLoader &loader) {
	LoadInternal(loader);
}

std::string DuckRageExtension::Name() {
	return "duck_rage";
}

std::string DuckRageExtension::Version() const {
	return GetDuckRageExtensionVersion();
}

}  // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(duck_rage, loader) {
	duckdb::LoadInternal(loader);
}
}
