#include "SigningKey.h"

#include <array>
#include <stdexcept>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <folly/String.h>
#include <folly/ssl/OpenSSLHash.h>
#include <folly/ssl/OpenSSLPtrTypes.h>
#include <folly/synchronization/Hazptr.h>
#include <proxygen/lib/utils/Base64.h>

using folly::StringPiece;
using folly::ssl::OpenSSLHash;
using folly::ssl::BioUniquePtr;
using folly::ssl::EcKeyUniquePtr;
using folly::ssl::EcdsaSigUniquePtr;
using folly::ssl::EvpPkeyUniquePtr;
using proxygen::Base64;

class SigningKey::Data : public folly::hazptr_obj_base<SigningKey::Data> {
 public:
  EvpPkeyUniquePtr pkey;
  /* Owned reference into pkey */
  EcKeyUniquePtr ec;
  std::string keyId;
};

static std::string fingerprint(EVP_PKEY *pkey) {
  unsigned char *der = nullptr;
  int len = i2d_PUBKEY(pkey, &der);
  if (len <= 0)
    throw std::runtime_error("unable to encode public key");

  std::array<uint8_t, 32> digest;
  OpenSSLHash::sha256(folly::range(digest), folly::ByteRange(der, len));
  OPENSSL_free(der);
  return folly::hexlify(folly::ByteRange(folly::range(digest))).substr(0, 16);
}

static std::unique_ptr<SigningKey::Data> wrap(EvpPkeyUniquePtr pkey) {
  EcKeyUniquePtr ec(EVP_PKEY_get1_EC_KEY(pkey.get()));
  if (!ec)
    throw std::runtime_error("signing key is not an EC key");
  if (EC_GROUP_get_curve_name(EC_KEY_get0_group(ec.get())) != NID_X9_62_prime256v1)
    throw std::runtime_error("signing key is not on the P-256 curve");

  auto data = std::make_unique<SigningKey::Data>();
  data->keyId = fingerprint(pkey.get());
  data->ec = std::move(ec);
  data->pkey = std::move(pkey);
  return data;
}

std::unique_ptr<SigningKey::Data> SigningKey::fromPEM(StringPiece pem) {
  BioUniquePtr bio(BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())));
  EvpPkeyUniquePtr pkey(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr));
  if (!pkey)
    throw std::runtime_error("unable to parse PEM private key");
  return wrap(std::move(pkey));
}

std::unique_ptr<SigningKey::Data> SigningKey::generate() {
  EcKeyUniquePtr ec(EC_KEY_new_by_curve_name(NID_X9_62_prime256v1));
  if (!ec || EC_KEY_generate_key(ec.get()) != 1)
    throw std::runtime_error("unable to generate P-256 key");

  EvpPkeyUniquePtr pkey(EVP_PKEY_new());
  if (!pkey || EVP_PKEY_assign_EC_KEY(pkey.get(), ec.get()) != 1)
    throw std::runtime_error("unable to wrap P-256 key");
  ec.release();
  return wrap(std::move(pkey));
}

const std::string& SigningKey::keyId() const {
  return data_->keyId;
}

std::string SigningKey::sign(StringPiece message) const {
  std::array<uint8_t, 32> digest;
  std::array<uint8_t, 64> sigbuf;

  OpenSSLHash::sha256(folly::range(digest), message);

  EcdsaSigUniquePtr sig(ECDSA_do_sign(digest.data(), digest.size(),
                                      data_->ec.get()));
  if (!sig)
    throw std::runtime_error("ECDSA signing failed");

  const BIGNUM *r, *s;
  ECDSA_SIG_get0(sig.get(), &r, &s);
  if (BN_num_bytes(r) > 32 || BN_num_bytes(s) > 32)
    throw std::runtime_error("ECDSA signature out of range");

  BN_bn2binpad(r, sigbuf.data()+00, 32);
  BN_bn2binpad(s, sigbuf.data()+32, 32);
  return Base64::urlEncode(folly::range(sigbuf));
}

bool SigningKey::verify(StringPiece message, StringPiece signature) const {
  std::string sigbuf = Base64::urlDecode(signature.str());
  if (sigbuf.size() != 64)
    return false;

  EcdsaSigUniquePtr sig(ECDSA_SIG_new());
  auto raw = folly::ByteRange(folly::StringPiece(sigbuf));
  BIGNUM *r = BN_bin2bn(raw.data(), 32, nullptr);
  BIGNUM *s = BN_bin2bn(raw.data() + 32, 32, nullptr);
  ECDSA_SIG_set0(sig.get(), r, s);

  std::array<uint8_t, 32> digest;
  OpenSSLHash::sha256(folly::range(digest), message);
  return ECDSA_do_verify(digest.data(), digest.size(), sig.get(),
                         data_->ec.get()) == 1;
}

std::string SigningKey::publicPEM() const {
  BioUniquePtr bio(BIO_new(BIO_s_mem()));
  if (PEM_write_bio_PUBKEY(bio.get(), data_->pkey.get()) != 1)
    throw std::runtime_error("unable to encode public key");
  char *buf = nullptr;
  long len = BIO_get_mem_data(bio.get(), &buf);
  return std::string(buf, len);
}

void SigningKey::commit(std::unique_ptr<Data> recruit, std::atomic<Data*> &global) {
  auto veteran = global.exchange(recruit.release());
  if (veteran)
    veteran->retire();
}

SigningKey::SigningKey(std::unique_ptr<Data> data) {
  holder_.reset(data.get());
  data->retire();
  data_ = data.release();
}

SigningKey::SigningKey(std::atomic<Data*> &global)
  : data_(holder_.get_protected(global))
{
}

SigningKey::SigningKey(SigningKey&& rhs) noexcept = default;
SigningKey::~SigningKey() noexcept = default;
void std::default_delete<SigningKey::Data>::operator()(SigningKey::Data *ptr) const { delete ptr; }
