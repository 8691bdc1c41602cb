#include "integrity_hasher.hpp"

#include <openssl/evp.h>

#include <array>
#include <stdexcept>

namespace {

std::string digest_to_hex(const unsigned char *digest, unsigned int length) {
  static const char hex_chars[] = "0123456789abcdef";
  std::string hex;
  hex.reserve(length * 2);
  for (unsigned int i = 0; i < length; ++i) {
    hex.push_back(hex_chars[digest[i] >> 4]);
    hex.push_back(hex_chars[digest[i] & 0x0f]);
  }
  return hex;
}

} // namespace

void IntegrityHasher::CtxDeleter::operator()(EVP_MD_CTX *ctx) const {
  EVP_MD_CTX_free(ctx);
}

IntegrityHasher::IntegrityHasher() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_)
    throw std::runtime_error("Failed to create OpenSSL EVP context");
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("Failed to initialize SHA-256 digest");
}

IntegrityHasher::~IntegrityHasher() = default;
IntegrityHasher::IntegrityHasher(IntegrityHasher &&) noexcept = default;
IntegrityHasher &
IntegrityHasher::operator=(IntegrityHasher &&) noexcept = default;

void IntegrityHasher::update(std::string_view bytes) {
  if (bytes.empty())
    return;
  if (EVP_DigestUpdate(ctx_.get(), bytes.data(), bytes.size()) != 1)
    throw std::runtime_error("Failed to update SHA-256 digest");
  bytes_hashed_ += bytes.size();
}

std::string IntegrityHasher::hex_digest() const {
  // Finalize a copy so the running context can keep absorbing bytes
  std::unique_ptr<EVP_MD_CTX, CtxDeleter> copy(EVP_MD_CTX_new());
  if (!copy || EVP_MD_CTX_copy_ex(copy.get(), ctx_.get()) != 1)
    throw std::runtime_error("Failed to copy SHA-256 digest state");

  std::array<unsigned char, EVP_MAX_MD_SIZE> output{};
  unsigned int output_len = 0;
  if (EVP_DigestFinal_ex(copy.get(), output.data(), &output_len) != 1)
    throw std::runtime_error("Failed to finalize SHA-256 digest");
  return digest_to_hex(output.data(), output_len);
}

std::string IntegrityHasher::sha256_hex(std::string_view bytes) {
  IntegrityHasher hasher;
  hasher.update(bytes);
  return hasher.hex_digest();
}
