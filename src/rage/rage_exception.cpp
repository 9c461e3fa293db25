#include "rage/rage_exception.hpp"

namespace duckdb {
namespace rage {

const char *RageErrorKindToString(RageErrorKind kind) {
	switch (kind) {
	case RageErrorKind::LOCATION:
		return "[location]";
	case RageErrorKind::DECRYPTION:
		return "[decryption]";
	case RageErrorKind::MALFORMED_STORE:
		return "[store]";
	case RageErrorKind::SECRET_NOT_FOUND:
		return "[lookup]";
	case RageErrorKind::ASSEMBLY:
		return "[assembly]";
	}
	return "[unknown]";
}

RageException::RageException(RageErrorKind kind_p, ExceptionType type, const std::string &msg)
    : Exception(type, std::string("duck_rage ") + RageErrorKindToString(kind_p) + " " + msg), kind(kind_p) {
}

LocationException::LocationException(const std::string &msg)
    : RageException(RageErrorKind::LOCATION, ExceptionType::IO, msg) {
}

DecryptionException::DecryptionException(const std::string &msg)
    : RageException(RageErrorKind::DECRYPTION, ExceptionType::INVALID_INPUT, msg) {
}

MalformedStoreException::MalformedStoreException(const std::string &msg)
    : RageException(RageErrorKind::MALFORMED_STORE, ExceptionType::INVALID_INPUT, msg) {
}

SecretNotFoundException::SecretNotFoundException(const std::string &msg)
    : RageException(RageErrorKind::SECRET_NOT_FOUND, ExceptionType::INVALID_INPUT, msg) {
}

AssemblyException::AssemblyException(const std::string &msg)
    : RageException(RageErrorKind::ASSEMBLY, ExceptionType::INVALID_INPUT, msg) {
}

}  // namespace rage
}  // namespace duckdb
