//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/command_decryptor.hpp
//
// Decryption through an age-compatible command line tool (rage or age)
//===----------------------------------------------------------------------===//

#pragma once

#include "rage/decryptor.hpp"

#include <string>

namespace duckdb {
namespace rage {

constexpr const char *DEFAULT_DECRYPT_COMMAND = "rage";
constexpr int64_t DEFAULT_MAX_SECRETS_FILE_SIZE = 1024 * 1024;

// True when the executable name (path stripped) is `rage` or `age`.
// Any other program would receive a caller-chosen file as its argument.
bool IsAllowedDecryptCommand(const std::string &command);

// Runs `<command> -d -i <identity_path>` with the container on stdin.
// Cleartext is read from stdout straight into a SecureBuffer; nothing touches disk.
// Not available on Windows.
class CommandDecryptor : public Decryptor {
public:
	explicit CommandDecryptor(std::string command = DEFAULT_DECRYPT_COMMAND,
	                          int64_t max_output_size = DEFAULT_MAX_SECRETS_FILE_SIZE);

	SecureBuffer Decrypt(const std::vector<uint8_t> &container, const std::string &identity_path) override;

	std::string GetName() const override;

private:
	std::string command_;
	int64_t max_output_size_;
};

}  // namespace rage
}  // namespace duckdb
