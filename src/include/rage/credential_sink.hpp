//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/credential_sink.hpp
//
// Receiver of finished credential records
//===----------------------------------------------------------------------===//

#pragma once

#include "rage/credential.hpp"

#include <string>

namespace duckdb {
namespace rage {

// Registers a record keyed by its secret_name with create-or-replace semantics.
// Returns a human-readable status that must not contain the secret value.
class CredentialSink {
public:
	virtual ~CredentialSink() = default;

	virtual std::string Register(const CredentialRecord &record) = 0;
};

// "Secret 'duck_rage_<db>' created for <user>@<host>:<port>/<db>"
std::string FormatRegistrationStatus(const CredentialRecord &record);

}  // namespace rage
}  // namespace duckdb
