//===----------------------------------------------------------------------===//
//                         DuckDB Rage Extension
//
// rage/secure_buffer.hpp
//
// Move-only buffers for decrypted material. Memory is zeroed on release.
//===----------------------------------------------------------------------===//

#pragma once

#include "duckdb/common/types.hpp"
#include "duckdb/common/unique_ptr.hpp"

#include <string>

namespace duckdb {
namespace rage {

// Overwrite memory in a way the compiler cannot elide
void SecureZero(void *data, idx_t size);

//===----------------------------------------------------------------------===//
// SecureBuffer - heap buffer that zeroes its whole capacity on release
//
// Growth never leaves a stale copy behind: the old allocation is zeroed
// before it is freed. Copying is disabled; ownership moves.
//===----------------------------------------------------------------------===//

class SecureBuffer {
public:
	SecureBuffer();
	explicit SecureBuffer(idx_t capacity);
	SecureBuffer(const char *data, idx_t size);
	~SecureBuffer();

	// Non-copyable
	SecureBuffer(const SecureBuffer &) = delete;
	SecureBuffer &operator=(const SecureBuffer &) = delete;

	// Movable
	SecureBuffer(SecureBuffer &&other) noexcept;
	SecureBuffer &operator=(SecureBuffer &&other) noexcept;

	char *GetData() {
		return data_.get();
	}
	const char *GetData() const {
		return data_.get();
	}
	idx_t GetSize() const {
		return size_;
	}
	idx_t GetCapacity() const {
		return capacity_;
	}
	bool Empty() const {
		return size_ == 0;
	}

	// Ensure room for at least `capacity` bytes; extra bytes are zero-filled
	void Reserve(idx_t capacity);

	void Append(const char *data, idx_t size);

	// Zero and free the allocation
	void Clear();

private:
	unsafe_unique_array<char> data_;
	idx_t size_;
	idx_t capacity_;
};

//===----------------------------------------------------------------------===//
// SecureString - a secret value backed by a SecureBuffer
//===----------------------------------------------------------------------===//

class SecureString {
public:
	SecureString() = default;
	SecureString(const char *data, idx_t size);
	explicit SecureString(const std::string &value);

	SecureString(const SecureString &) = delete;
	SecureString &operator=(const SecureString &) = delete;
	SecureString(SecureString &&other) noexcept = default;
	SecureString &operator=(SecureString &&other) noexcept = default;

	const char *GetData() const {
		return buffer_.GetData();
	}
	idx_t GetSize() const {
		return buffer_.GetSize();
	}
	bool Empty() const {
		return buffer_.Empty();
	}

	// Plain std::string copy for hand-off to a consumer that owns its own storage.
	// The returned copy is outside the zeroing guarantee.
	std::string GetString() const;

	// Explicit deep copy
	SecureString Copy() const;

	bool Equals(const char *data, idx_t size) const;

	void Clear() {
		buffer_.Clear();
	}

private:
	SecureBuffer buffer_;
};

}  // namespace rage
}  // namespace duckdb
