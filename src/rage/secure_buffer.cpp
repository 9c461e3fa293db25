#include "rage/secure_buffer.hpp"

#include "duckdb/common/helper.hpp"

#include <mbedtls/platform_util.h>

#include <cstring>
#include <utility>

namespace duckdb {
namespace rage {

void SecureZero(void *data, idx_t size) {
	if (data && size > 0) {
		mbedtls_platform_zeroize(data, static_cast<size_t>(size));
	}
}

//===----------------------------------------------------------------------===//
// SecureBuffer
//===----------------------------------------------------------------------===//

SecureBuffer::SecureBuffer() : size_(0), capacity_(0) {}

SecureBuffer::SecureBuffer(idx_t capacity) : SecureBuffer() {
	Reserve(capacity);
}

SecureBuffer::SecureBuffer(const char *data, idx_t size) : SecureBuffer() {
	Append(data, size);
}

SecureBuffer::~SecureBuffer() {
	Clear();
}

SecureBuffer::SecureBuffer(SecureBuffer &&other) noexcept
    : data_(std::move(other.data_)), size_(other.size_), capacity_(other.capacity_) {
	other.size_ = 0;
	other.capacity_ = 0;
}

SecureBuffer &SecureBuffer::operator=(SecureBuffer &&other) noexcept {
	if (this != &other) {
		Clear();
		data_ = std::move(other.data_);
		size_ = other.size_;
		capacity_ = other.capacity_;
		other.size_ = 0;
		other.capacity_ = 0;
	}
	return *this;
}

void SecureBuffer::Reserve(idx_t capacity) {
	if (capacity <= capacity_) {
		return;
	}
	auto new_data = make_unsafe_uniq_array<char>(capacity);
	std::memset(new_data.get(), 0, capacity);
	if (data_) {
		std::memcpy(new_data.get(), data_.get(), size_);
		SecureZero(data_.get(), capacity_);
	}
	data_ = std::move(new_data);
	capacity_ = capacity;
}

void SecureBuffer::Append(const char *data, idx_t size) {
	if (size == 0) {
		return;
	}
	if (size_ + size > capacity_) {
		// Geometric growth keeps the number of zero-and-copy cycles small
		idx_t new_capacity = capacity_ == 0 ? 64 : capacity_;
		while (new_capacity < size_ + size) {
			new_capacity *= 2;
		}
		Reserve(new_capacity);
	}
	std::memcpy(data_.get() + size_, data, size);
	size_ += size;
}

void SecureBuffer::Clear() {
	if (data_) {
		SecureZero(data_.get(), capacity_);
		data_.reset();
	}
	size_ = 0;
	capacity_ = 0;
}

//===----------------------------------------------------------------------===//
// SecureString
//===----------------------------------------------------------------------===//

SecureString::SecureString(const char *data, idx_t size) : buffer_(data, size) {}

SecureString::SecureString(const std::string &value) : buffer_(value.data(), value.size()) {}

std::string SecureString::GetString() const {
	if (buffer_.Empty()) {
		return std::string();
	}
	return std::string(buffer_.GetData(), buffer_.GetSize());
}

SecureString SecureString::Copy() const {
	return SecureString(buffer_.GetData(), buffer_.GetSize());
}

bool SecureString::Equals(const char *data, idx_t size) const {
	if (size != buffer_.GetSize()) {
		return false;
	}
	return size == 0 || std::memcmp(buffer_.GetData(), data, size) == 0;
}

}  // namespace rage
}  // namespace duckdb
