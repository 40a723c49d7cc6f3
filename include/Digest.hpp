#pragma once

#include <string>
#include <string_view>
#ifdef __cplusplus
extern "C" {
#endif
#include <openssl/evp.h>
#ifdef __cplusplus
}
#endif

namespace http_resilience {

// Algorithms exposed as factories, add a line to support another one
#define DIGEST_ALGORITHMS(DIGEST_ALGORITHM) \
	DIGEST_ALGORITHM(md5, EVP_md5) \
	DIGEST_ALGORITHM(sha1, EVP_sha1) \
	DIGEST_ALGORITHM(sha256, EVP_sha256)

/**
 * Incremental message digest over OpenSSL EVP.
 * Not thread-safe, one instance per computation.
 */
class Digest {
public:
	explicit Digest(const EVP_MD* md);
	~Digest();

#define DIGEST_DECLARE(name, evp_func) \
	static Digest name(); \
	static std::string name##Hex(std::string_view data);

	DIGEST_ALGORITHMS(DIGEST_DECLARE)

#undef DIGEST_DECLARE

	// Movable, not copyable
	Digest(const Digest&) = delete;
	Digest& operator=(const Digest&) = delete;
	Digest(Digest&& other) noexcept;
	Digest& operator=(Digest&& other) noexcept;

	Digest& update(const void* data, std::size_t len);
	Digest& update(std::string_view data);

	// Raw digest bytes, idempotent
	std::string final();
	std::string hexFinal();

	static std::string toHex(const std::string& bin);

private:
	const EVP_MD* md_ = nullptr;
	EVP_MD_CTX* ctx_ = nullptr;
	bool finalized_ = false;
	std::string result_;
};

} // namespace http_resilience
