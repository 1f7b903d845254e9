#ifndef GUARD_EVIDENCE_SIGNING_KEY_H
#define GUARD_EVIDENCE_SIGNING_KEY_H

#include <atomic>
#include <memory>
#include <string>
#include <folly/Range.h>
#include <folly/synchronization/HazptrHolder.h>

/**
 * ES256 key used to sign evidence packages. The active key is a global
 * swapped at runtime; readers hold it under a hazard pointer.
 */
class SigningKey {
 public:
  class Data;

  /** Construct taking ownership of Data. */
  SigningKey(std::unique_ptr<Data> data);
  /** Construct from globals and hold protected reference. */
  SigningKey(std::atomic<Data*> &global);
  SigningKey(SigningKey&& rhs) noexcept;
  /** Get the process-wide key installed by the control socket. */
  static SigningKey get() noexcept;
  ~SigningKey() noexcept;

  explicit operator bool() const noexcept { return data_ != nullptr; }

  /** First 16 hex digits of the SHA-256 of the DER public key. */
  const std::string& keyId() const;
  /** base64url of raw r||s over SHA-256(message). */
  std::string sign(folly::StringPiece message) const;
  bool verify(folly::StringPiece message, folly::StringPiece signature) const;
  std::string publicPEM() const;

  /* Load a P-256 private key, throws std::runtime_error */
  static std::unique_ptr<Data> fromPEM(folly::StringPiece pem);
  /* Fresh random P-256 key */
  static std::unique_ptr<Data> generate();

  /* Exchange current key with global */
  static void commit(std::unique_ptr<Data> recruit,
                     std::atomic<Data*> &global);

 private:
  folly::hazptr_holder<> holder_;
  const Data *data_;
};

namespace std {
  template<>
  struct default_delete<SigningKey::Data> {
    void operator()(SigningKey::Data *ptr) const;
  };
}

#endif // GUARD_EVIDENCE_SIGNING_KEY_H
