#include "Digest.hpp"

#include <cstdint>
#include <stdexcept>
#include <utility>

namespace http_resilience {

Digest::Digest(const EVP_MD* md) : md_(md), ctx_(EVP_MD_CTX_new()) {
	if (!this->md_) {
		EVP_MD_CTX_free(this->ctx_);
		throw std::invalid_argument("Digest: null EVP_MD");
	}
	if (!this->ctx_) throw std::runtime_error("Digest: EVP_MD_CTX_new failed");
	if (EVP_DigestInit_ex(this->ctx_, this->md_, nullptr) != 1) {
		EVP_MD_CTX_free(this->ctx_);
		throw std::runtime_error("Digest: EVP_DigestInit_ex failed");
	}
}

Digest::~Digest() {
	if (this->ctx_) EVP_MD_CTX_free(this->ctx_);
}

#define DIGEST_DEFINE(name, evp_func) \
	Digest Digest::name() { return Digest(evp_func()); } \
	std::string Digest::name##Hex(std::string_view data) { \
		return Digest(evp_func()).update(data).hexFinal(); \
	}

DIGEST_ALGORITHMS(DIGEST_DEFINE)

#undef DIGEST_DEFINE

Digest::Digest(Digest&& other) noexcept
	: md_(std::exchange(other.md_, nullptr)),
	  ctx_(std::exchange(other.ctx_, nullptr)),
	  finalized_(std::exchange(other.finalized_, false)),
	  result_(std::move(other.result_)) {}

Digest& Digest::operator=(Digest&& other) noexcept {
	if (this != &other) {
		if (this->ctx_) EVP_MD_CTX_free(this->ctx_);
		this->md_ = std::exchange(other.md_, nullptr);
		this->ctx_ = std::exchange(other.ctx_, nullptr);
		this->finalized_ = std::exchange(other.finalized_, false);
		this->result_ = std::move(other.result_);
	}
	return *this;
}

Digest& Digest::update(const void* data, std::size_t len) {
	if (this->finalized_)
		throw std::logic_error("Digest: update after final");
	if (EVP_DigestUpdate(this->ctx_, data, len) != 1)
		throw std::runtime_error("Digest: EVP_DigestUpdate failed");
	return *this;
}

Digest& Digest::update(std::string_view data) {
	return this->update(data.data(), data.size());
}

std::string Digest::final() {
	if (!this->finalized_) {
		this->finalized_ = true;

		int md_size = EVP_MD_size(this->md_);
		if (md_size <= 0) throw std::runtime_error("Digest: EVP_MD_size <= 0");

		unsigned int out_len = 0;
		this->result_.resize(md_size);
		if (EVP_DigestFinal_ex(this->ctx_, reinterpret_cast<unsigned char*>(this->result_.data()), &out_len) != 1)
			throw std::runtime_error("Digest: EVP_DigestFinal_ex failed");

		this->result_.resize(out_len);
	}
	return this->result_;
}

std::string Digest::hexFinal() {
	return toHex(this->final());
}

std::string Digest::toHex(const std::string& bin) {
	static const char hex_chars[] = "0123456789abcdef";
	std::string hex;
	hex.reserve(bin.size() * 2);
	for (unsigned char c : bin) {
		hex += hex_chars[(c >> 4) & 0x0F];
		hex += hex_chars[c & 0x0F];
	}
	return hex;
}

} // namespace http_resilience
