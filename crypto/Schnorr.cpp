#include "Schnorr.h"
#include "Hash.h"

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <memory>

namespace bt {
namespace crypto {

namespace {

struct BnDeleter {
  void operator()(BIGNUM *bn) const { BN_clear_free(bn); }
};
struct BnCtxDeleter {
  void operator()(BN_CTX *ctx) const { BN_CTX_free(ctx); }
};
struct PointDeleter {
  void operator()(EC_POINT *point) const { EC_POINT_free(point); }
};
struct GroupDeleter {
  void operator()(EC_GROUP *group) const { EC_GROUP_free(group); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PointPtr = std::unique_ptr<EC_POINT, PointDeleter>;
using GroupPtr = std::unique_ptr<EC_GROUP, GroupDeleter>;

constexpr size_t SCALAR_SIZE = 32;
constexpr int MAX_SIGN_ATTEMPTS = 16;

// The group is immutable once built and safe to share between threads
const EC_GROUP *secp256k1() {
  static const GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
  return group.get();
}

bool hasCompressedPrefix(const std::string &bytes) {
  return !bytes.empty() && (bytes[0] == 0x02 || bytes[0] == 0x03);
}

BnPtr scalarFromBytes(const std::string &bytes) {
  return BnPtr(BN_bin2bn(reinterpret_cast<const unsigned char *>(bytes.data()),
                         static_cast<int>(bytes.size()), nullptr));
}

PointPtr decodePoint(const std::string &bytes, BN_CTX *ctx) {
  const EC_GROUP *group = secp256k1();
  PointPtr point(EC_POINT_new(group));
  if (!point) {
    return nullptr;
  }
  if (EC_POINT_oct2point(group, point.get(),
                         reinterpret_cast<const unsigned char *>(bytes.data()),
                         bytes.size(), ctx) != 1) {
    return nullptr;
  }
  if (EC_POINT_is_at_infinity(group, point.get())) {
    return nullptr;
  }
  return point;
}

std::string encodePoint(const EC_POINT *point, BN_CTX *ctx) {
  std::string out(PUBLIC_KEY_SIZE, '\0');
  size_t written = EC_POINT_point2oct(
      secp256k1(), point, POINT_CONVERSION_COMPRESSED,
      reinterpret_cast<unsigned char *>(out.data()), out.size(), ctx);
  if (written != PUBLIC_KEY_SIZE) {
    return {};
  }
  return out;
}

std::string encodeScalar(const BIGNUM *scalar) {
  std::string out(SCALAR_SIZE, '\0');
  if (BN_bn2binpad(scalar, reinterpret_cast<unsigned char *>(out.data()),
                   static_cast<int>(SCALAR_SIZE)) != static_cast<int>(SCALAR_SIZE)) {
    return {};
  }
  return out;
}

// e = H(a || message || pubkey) read as a big-endian integer
BnPtr challenge(const std::string &commitment, const std::string &message,
                const std::string &pubkey) {
  return scalarFromBytes(blake2b256(commitment + message + pubkey));
}

// Secret scalars must lie in [1, n-1]
bool isValidScalar(const BIGNUM *scalar) {
  return scalar && !BN_is_zero(scalar) &&
         BN_cmp(scalar, EC_GROUP_get0_order(secp256k1())) < 0;
}

Roe<std::string> derivePublicKey(const BIGNUM *secret, BN_CTX *ctx) {
  const EC_GROUP *group = secp256k1();
  PointPtr point(EC_POINT_new(group));
  if (!point || EC_POINT_mul(group, point.get(), secret, nullptr, nullptr, ctx) != 1) {
    return Error(E_CRYPTO_INTERNAL, "Failed to derive public key");
  }
  std::string encoded = encodePoint(point.get(), ctx);
  if (encoded.empty()) {
    return Error(E_CRYPTO_INTERNAL, "Failed to encode public key");
  }
  return encoded;
}

} // namespace

std::string signingMessage(const std::string &recipientPubkey, uint64_t amount,
                           uint64_t timestamp) {
  std::string message;
  message.reserve(SIGNING_MESSAGE_SIZE);
  message += recipientPubkey;
  for (int shift = 56; shift >= 0; shift -= 8) {
    message.push_back(static_cast<char>((amount >> shift) & 0xff));
  }
  for (int shift = 56; shift >= 0; shift -= 8) {
    message.push_back(static_cast<char>((timestamp >> shift) & 0xff));
  }
  return message;
}

Roe<void> validatePublicKey(const std::string &pubkey) {
  if (pubkey.size() != PUBLIC_KEY_SIZE) {
    return Error(E_INVALID_PUBLIC_KEY, "Public key must be " +
                                           std::to_string(PUBLIC_KEY_SIZE) +
                                           " bytes, got " +
                                           std::to_string(pubkey.size()));
  }
  if (!hasCompressedPrefix(pubkey)) {
    return Error(E_INVALID_PUBLIC_KEY,
                 "Public key must be a compressed point (0x02/0x03 prefix)");
  }

  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx || !secp256k1()) {
    return Error(E_CRYPTO_INTERNAL, "Failed to set up curve context");
  }
  if (!decodePoint(pubkey, ctx.get())) {
    return Error(E_INVALID_PUBLIC_KEY, "Public key is not a point on secp256k1");
  }
  return {};
}

Roe<void> validateSignatureFormat(const std::string &signature) {
  if (signature.size() != SIGNATURE_SIZE) {
    return Error(E_INVALID_SIGNATURE_FORMAT,
                 "Signature must be " + std::to_string(SIGNATURE_SIZE) +
                     " bytes, got " + std::to_string(signature.size()));
  }
  if (!hasCompressedPrefix(signature)) {
    return Error(E_INVALID_SIGNATURE_FORMAT,
                 "Signature commitment must be a compressed point");
  }

  std::string zBytes = signature.substr(PUBLIC_KEY_SIZE);
  BnPtr z = scalarFromBytes(zBytes);
  if (!z || !secp256k1()) {
    return Error(E_CRYPTO_INTERNAL, "Failed to decode signature scalar");
  }
  if (BN_is_zero(z.get())) {
    return Error(E_INVALID_SIGNATURE_FORMAT, "Signature response scalar is zero");
  }
  if (BN_cmp(z.get(), EC_GROUP_get0_order(secp256k1())) >= 0) {
    return Error(E_INVALID_SIGNATURE_FORMAT,
                 "Signature response scalar is not reduced");
  }
  return {};
}

Roe<KeyPair> generateKeyPair() {
  for (int attempt = 0; attempt < MAX_SIGN_ATTEMPTS; ++attempt) {
    std::string secret = utl::randomBytes(SECRET_KEY_SIZE);
    auto pubkey = publicKeyFromSecret(secret);
    if (pubkey) {
      return KeyPair{ secret, pubkey.value() };
    }
    utl::secureZero(secret);
    if (pubkey.error().code != E_INVALID_SECRET_KEY) {
      return pubkey.error();
    }
  }
  return Error(E_CRYPTO_INTERNAL, "Failed to generate a valid secret key");
}

Roe<std::string> publicKeyFromSecret(const std::string &secretKey) {
  if (secretKey.size() != SECRET_KEY_SIZE) {
    return Error(E_INVALID_SECRET_KEY,
                 "Secret key must be " + std::to_string(SECRET_KEY_SIZE) + " bytes");
  }
  BnCtxPtr ctx(BN_CTX_new());
  BnPtr secret = scalarFromBytes(secretKey);
  if (!ctx || !secret || !secp256k1()) {
    return Error(E_CRYPTO_INTERNAL, "Failed to set up curve context");
  }
  if (!isValidScalar(secret.get())) {
    return Error(E_INVALID_SECRET_KEY, "Secret key is out of range");
  }
  return derivePublicKey(secret.get(), ctx.get());
}

Roe<std::string> sign(const std::string &message, const std::string &secretKey,
                      const std::string &pubkey) {
  auto pubkeyCheck = validatePublicKey(pubkey);
  if (!pubkeyCheck) {
    return pubkeyCheck.error();
  }
  if (secretKey.size() != SECRET_KEY_SIZE) {
    return Error(E_INVALID_SECRET_KEY,
                 "Secret key must be " + std::to_string(SECRET_KEY_SIZE) + " bytes");
  }

  const EC_GROUP *group = secp256k1();
  const BIGNUM *order = EC_GROUP_get0_order(group);
  BnCtxPtr ctx(BN_CTX_new());
  BnPtr secret = scalarFromBytes(secretKey);
  if (!ctx || !secret) {
    return Error(E_CRYPTO_INTERNAL, "Failed to set up curve context");
  }
  if (!isValidScalar(secret.get())) {
    return Error(E_INVALID_SECRET_KEY, "Secret key is out of range");
  }

  auto derived = derivePublicKey(secret.get(), ctx.get());
  if (!derived) {
    return derived.error();
  }
  if (derived.value() != pubkey) {
    return Error(E_INVALID_PUBLIC_KEY, "Public key does not match secret key");
  }

  for (int attempt = 0; attempt < MAX_SIGN_ATTEMPTS; ++attempt) {
    std::string nonceBytes = utl::randomBytes(SCALAR_SIZE);
    BnPtr k = scalarFromBytes(nonceBytes);
    utl::secureZero(nonceBytes);
    if (!isValidScalar(k.get())) {
      continue;
    }

    PointPtr commitmentPoint(EC_POINT_new(group));
    if (!commitmentPoint ||
        EC_POINT_mul(group, commitmentPoint.get(), k.get(), nullptr, nullptr,
                     ctx.get()) != 1) {
      return Error(E_CRYPTO_INTERNAL, "Failed to compute nonce commitment");
    }
    std::string commitment = encodePoint(commitmentPoint.get(), ctx.get());
    if (commitment.empty()) {
      return Error(E_CRYPTO_INTERNAL, "Failed to encode nonce commitment");
    }

    BnPtr e = challenge(commitment, message, pubkey);
    if (!e) {
      return Error(E_CRYPTO_INTERNAL, "Failed to compute challenge");
    }
    if (BN_cmp(e.get(), order) >= 0) {
      continue;
    }

    BnPtr es(BN_new());
    BnPtr z(BN_new());
    if (!es || !z ||
        BN_mod_mul(es.get(), e.get(), secret.get(), order, ctx.get()) != 1 ||
        BN_mod_add(z.get(), k.get(), es.get(), order, ctx.get()) != 1) {
      return Error(E_CRYPTO_INTERNAL, "Failed to compute response scalar");
    }
    if (BN_is_zero(z.get())) {
      continue;
    }

    std::string response = encodeScalar(z.get());
    if (response.empty()) {
      return Error(E_CRYPTO_INTERNAL, "Failed to encode response scalar");
    }
    return commitment + response;
  }

  return Error(E_CRYPTO_INTERNAL, "Failed to produce a signature");
}

Roe<void> verify(const std::string &signature, const std::string &message,
                 const std::string &pubkey) {
  auto pubkeyCheck = validatePublicKey(pubkey);
  if (!pubkeyCheck) {
    return pubkeyCheck;
  }
  auto formatCheck = validateSignatureFormat(signature);
  if (!formatCheck) {
    return formatCheck;
  }

  const EC_GROUP *group = secp256k1();
  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    return Error(E_CRYPTO_INTERNAL, "Failed to set up curve context");
  }

  PointPtr publicPoint = decodePoint(pubkey, ctx.get());
  if (!publicPoint) {
    return Error(E_INVALID_PUBLIC_KEY, "Public key is not a point on secp256k1");
  }

  std::string commitment = signature.substr(0, PUBLIC_KEY_SIZE);
  PointPtr commitmentPoint = decodePoint(commitment, ctx.get());
  if (!commitmentPoint) {
    return Error(E_INVALID_SIGNATURE_FORMAT,
                 "Signature commitment is not a point on secp256k1");
  }

  BnPtr z = scalarFromBytes(signature.substr(PUBLIC_KEY_SIZE));
  BnPtr e = challenge(commitment, message, pubkey);
  if (!z || !e) {
    return Error(E_CRYPTO_INTERNAL, "Failed to decode scalars");
  }
  if (BN_cmp(e.get(), EC_GROUP_get0_order(group)) >= 0) {
    return Error(E_INVALID_SIGNATURE, "Challenge out of range");
  }

  // z*G
  PointPtr lhs(EC_POINT_new(group));
  // a + e*X
  PointPtr rhs(EC_POINT_new(group));
  if (!lhs || !rhs ||
      EC_POINT_mul(group, lhs.get(), z.get(), nullptr, nullptr, ctx.get()) != 1 ||
      EC_POINT_mul(group, rhs.get(), nullptr, publicPoint.get(), e.get(),
                   ctx.get()) != 1 ||
      EC_POINT_add(group, rhs.get(), rhs.get(), commitmentPoint.get(),
                   ctx.get()) != 1) {
    return Error(E_CRYPTO_INTERNAL, "Curve arithmetic failed");
  }

  int cmp = EC_POINT_cmp(group, lhs.get(), rhs.get(), ctx.get());
  if (cmp < 0) {
    return Error(E_CRYPTO_INTERNAL, "Point comparison failed");
  }
  if (cmp != 0) {
    return Error(E_INVALID_SIGNATURE, "Schnorr verification equation does not hold");
  }
  return {};
}

Roe<std::string> publicKeyFromHex(const std::string &hex) {
  std::string raw = utl::hexDecode(hex);
  if (raw.empty()) {
    return Error(E_INVALID_PUBLIC_KEY, "Public key is not valid hex");
  }
  auto result = validatePublicKey(raw);
  if (!result) {
    return result.error();
  }
  return raw;
}

Roe<std::string> signatureFromHex(const std::string &hex) {
  std::string raw = utl::hexDecode(hex);
  if (raw.empty()) {
    return Error(E_INVALID_SIGNATURE_FORMAT, "Signature is not valid hex");
  }
  auto result = validateSignatureFormat(raw);
  if (!result) {
    return result.error();
  }
  return raw;
}

} // namespace crypto
} // namespace bt
