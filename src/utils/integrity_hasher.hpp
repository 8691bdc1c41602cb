#ifndef INTEGRITY_HASHER_HPP
#define INTEGRITY_HASHER_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

typedef struct evp_md_ctx_st EVP_MD_CTX;

// Incremental SHA-256 over OpenSSL EVP. Feed the bytes in order with
// `update`; `hex_digest` may be called at any point and does not end the
// stream.
class IntegrityHasher {
public:
  IntegrityHasher();
  ~IntegrityHasher();

  IntegrityHasher(const IntegrityHasher &) = delete;
  IntegrityHasher &operator=(const IntegrityHasher &) = delete;
  IntegrityHasher(IntegrityHasher &&) noexcept;
  IntegrityHasher &operator=(IntegrityHasher &&) noexcept;

  void update(std::string_view bytes);

  // Lower-case hex digest of everything fed so far
  std::string hex_digest() const;

  uint64_t bytes_hashed() const { return bytes_hashed_; }

  // One-shot helper
  static std::string sha256_hex(std::string_view bytes);

private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX *ctx) const;
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  uint64_t bytes_hashed_ = 0;
};

#endif // INTEGRITY_HASHER_HPP
