#include "crypto/keypair.hpp"
#include "crypto/keystream.hpp"
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/param_build.h>
#include <openssl/pem.h>
#include <openssl/bio.h>
#include <functional>
#include <utility>
#include <boost/log/trivial.hpp>

namespace dfp::crypto {

namespace {

//==============================================
// BIGNUM RAII HELPERS
//==============================================

struct BnDeleter {
  void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};

struct BnCtxDeleter {
  void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); }
};

using BnPtr = std::unique_ptr<BIGNUM, BnDeleter>;
using BnCtxPtr = std::unique_ptr<BN_CTX, BnCtxDeleter>;
using PrimeFilter = std::function<bool(const BIGNUM*)>;

BnPtr new_bn() {
  BnPtr bn(BN_new());
  if (!bn) {
    throw KeyDerivationError("Failed to allocate big number");
  }
  return bn;
}

BnPtr bn_from_word(unsigned long word) {
  auto bn = new_bn();
  if (BN_set_word(bn.get(), word) != 1) {
    throw KeyDerivationError("Failed to set big number");
  }
  return bn;
}

BnPtr power_of_two(int exponent) {
  auto bn = new_bn();
  BN_zero(bn.get());
  if (BN_set_bit(bn.get(), exponent) != 1) {
    throw KeyDerivationError("Failed to set big number bit");
  }
  return bn;
}

void check(int rc, const char* what) {
  if (rc != 1) {
    throw KeyDerivationError(what);
  }
}

// Floor of the integer square root by Newton iteration
BnPtr isqrt(const BIGNUM* n, BN_CTX* ctx) {
  auto x = power_of_two((BN_num_bits(n) + 1) / 2);
  auto quotient = new_bn();
  auto y = new_bn();

  while (true) {
    check(BN_div(quotient.get(), nullptr, n, x.get(), ctx), "isqrt division failed");
    check(BN_add(y.get(), x.get(), quotient.get()), "isqrt addition failed");
    check(BN_rshift1(y.get(), y.get()), "isqrt shift failed");
    if (BN_cmp(y.get(), x.get()) >= 0) {
      return x;
    }
    std::swap(x, y);
  }
}

//==============================================
// KEYSTREAM DRIVEN INTEGERS
//==============================================

// Reads an integer of `bits` bits: one most significant byte followed by the
// remaining bytes, big-endian. With exact set the top bit is forced.
BnPtr random_integer(CounterKeystream& stream, int bits, bool exact) {
  const size_t bytes_needed = static_cast<size_t>((bits - 1) / 8 + 1);
  const int significant_bits_msb = 8 - static_cast<int>(bytes_needed * 8 - static_cast<size_t>(bits));

  unsigned int msb = stream.next_byte();
  if (exact) {
    msb |= 1u << (significant_bits_msb - 1);
  }
  msb &= (1u << significant_bits_msb) - 1;

  std::vector<uint8_t> buffer;
  buffer.reserve(bytes_needed);
  buffer.push_back(static_cast<uint8_t>(msb));
  auto rest = stream.next(bytes_needed - 1);
  buffer.insert(buffer.end(), rest.begin(), rest.end());

  BnPtr value(BN_bin2bn(buffer.data(), static_cast<int>(buffer.size()), nullptr));
  if (!value) {
    throw KeyDerivationError("Failed to decode random integer");
  }
  return value;
}

// Uniform integer in [min_inclusive, max_inclusive] by rejection sampling
BnPtr random_range(CounterKeystream& stream, const BIGNUM* min_inclusive, const BIGNUM* max_inclusive) {
  auto norm_maximum = new_bn();
  check(BN_sub(norm_maximum.get(), max_inclusive, min_inclusive), "range subtraction failed");
  const int bits_needed = BN_num_bits(norm_maximum.get());

  BnPtr candidate;
  do {
    candidate = random_integer(stream, bits_needed, false);
  } while (BN_cmp(candidate.get(), norm_maximum.get()) > 0);

  check(BN_add(candidate.get(), candidate.get(), min_inclusive), "range addition failed");
  return candidate;
}

//==============================================
// PRIMALITY
//==============================================

// Rounds such that a random composite of this size survives with p < 1e-30
int miller_rabin_rounds(int bit_size) {
  static const std::pair<int, int> ranges[] = {
    {220, 30}, {280, 20}, {390, 15}, {512, 10}, {620, 7},
    {740, 6}, {890, 5}, {1200, 4}, {1700, 3}, {3700, 2}
  };
  for (const auto& [limit, rounds] : ranges) {
    if (bit_size < limit) {
      return rounds;
    }
  }
  return 1;
}

bool miller_rabin(const BIGNUM* candidate, int rounds, CounterKeystream& stream, BN_CTX* ctx) {
  if (!BN_is_odd(candidate)) {
    return false;
  }

  auto one = bn_from_word(1);
  auto two = bn_from_word(2);
  auto minus_one = new_bn();
  check(BN_sub(minus_one.get(), candidate, one.get()), "minus one failed");
  auto max_base = new_bn();
  check(BN_sub(max_base.get(), candidate, two.get()), "max base failed");

  // candidate - 1 = m * 2^a
  auto m = BnPtr(BN_dup(minus_one.get()));
  if (!m) {
    throw KeyDerivationError("Failed to copy big number");
  }
  int a = 0;
  while (!BN_is_odd(m.get())) {
    check(BN_rshift1(m.get(), m.get()), "shift failed");
    ++a;
  }

  auto z = new_bn();
  for (int i = 0; i < rounds; ++i) {
    auto base = random_range(stream, two.get(), max_base.get());
    check(BN_mod_exp(z.get(), base.get(), m.get(), candidate, ctx), "modular exponentiation failed");
    if (BN_is_one(z.get()) || BN_cmp(z.get(), minus_one.get()) == 0) {
      continue;
    }

    bool reached_minus_one = false;
    for (int j = 1; j < a; ++j) {
      check(BN_mod_sqr(z.get(), z.get(), candidate, ctx), "modular square failed");
      if (BN_cmp(z.get(), minus_one.get()) == 0) {
        reached_minus_one = true;
        break;
      }
      if (BN_is_one(z.get())) {
        return false;
      }
    }
    if (!reached_minus_one) {
      return false;
    }
  }
  return true;
}

BnPtr generate_probable_prime(CounterKeystream& stream, int bits, const PrimeFilter& filter, BN_CTX* ctx) {
  size_t attempts = 0;
  while (true) {
    ++attempts;
    auto candidate = random_integer(stream, bits, true);
    check(BN_set_bit(candidate.get(), 0), "set low bit failed");
    if (!filter(candidate.get())) {
      continue;
    }
    if (!miller_rabin(candidate.get(), miller_rabin_rounds(BN_num_bits(candidate.get())), stream, ctx)) {
      continue;
    }
    // Deterministic confirmation in place of the final Lucas test
    const int verdict = BN_check_prime(candidate.get(), ctx, nullptr);
    if (verdict < 0) {
      throw KeyDerivationError("Primality check failed");
    }
    if (verdict == 1) {
      BOOST_LOG_TRIVIAL(trace) << "Key derivation: Found " << bits << "-bit prime after " << attempts << " candidates";
      return candidate;
    }
  }
}

bool coprime_to_exponent(const BIGNUM* candidate, const BIGNUM* e, BN_CTX* ctx) {
  auto minus_one = BnPtr(BN_dup(candidate));
  auto gcd = new_bn();
  if (!minus_one) {
    throw KeyDerivationError("Failed to copy big number");
  }
  check(BN_sub_word(minus_one.get(), 1), "subtract failed");
  check(BN_gcd(gcd.get(), minus_one.get(), e, ctx), "gcd failed");
  return BN_is_one(gcd.get());
}

//==============================================
// OPENSSL KEY ASSEMBLY
//==============================================

EVP_PKEY* assemble_rsa_key(const BIGNUM* n, const BIGNUM* e, const BIGNUM* d,
                           const BIGNUM* p, const BIGNUM* q, BN_CTX* ctx) {
  auto p_minus_one = BnPtr(BN_dup(p));
  auto q_minus_one = BnPtr(BN_dup(q));
  if (!p_minus_one || !q_minus_one) {
    throw KeyDerivationError("Failed to copy big number");
  }
  check(BN_sub_word(p_minus_one.get(), 1), "subtract failed");
  check(BN_sub_word(q_minus_one.get(), 1), "subtract failed");

  auto dmp1 = new_bn();
  auto dmq1 = new_bn();
  check(BN_mod(dmp1.get(), d, p_minus_one.get(), ctx), "d mod (p-1) failed");
  check(BN_mod(dmq1.get(), d, q_minus_one.get(), ctx), "d mod (q-1) failed");
  BnPtr iqmp(BN_mod_inverse(nullptr, q, p, ctx));
  if (!iqmp) {
    throw KeyDerivationError("CRT coefficient does not exist");
  }

  std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)> builder(OSSL_PARAM_BLD_new(), &OSSL_PARAM_BLD_free);
  if (!builder) {
    throw KeyDerivationError("Failed to create parameter builder");
  }
  if (!OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_N, n) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_E, e) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_D, d) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_FACTOR1, p) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_FACTOR2, q) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_EXPONENT1, dmp1.get()) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_EXPONENT2, dmq1.get()) ||
      !OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_RSA_COEFFICIENT1, iqmp.get())) {
    throw KeyDerivationError("Failed to push RSA parameters");
  }

  std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)> params(OSSL_PARAM_BLD_to_param(builder.get()), &OSSL_PARAM_free);
  std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> pctx(EVP_PKEY_CTX_new_from_name(nullptr, "RSA", nullptr), &EVP_PKEY_CTX_free);
  if (!params || !pctx) {
    throw KeyDerivationError("Failed to prepare RSA key context");
  }

  EVP_PKEY* pkey = nullptr;
  if (EVP_PKEY_fromdata_init(pctx.get()) != 1 ||
      EVP_PKEY_fromdata(pctx.get(), &pkey, EVP_PKEY_KEYPAIR, params.get()) != 1) {
    throw KeyDerivationError("Failed to build RSA key from parameters");
  }
  return pkey;
}

} // namespace

//==============================================
// KEYPAIR
//==============================================

Keypair::Keypair(EVP_PKEY* pkey) : pkey_(pkey, &EVP_PKEY_free) {
  if (!pkey_) {
    throw InitializationError("Keypair: Null key");
  }
}

std::vector<uint8_t> Keypair::modulus() const {
  BIGNUM* raw = nullptr;
  if (EVP_PKEY_get_bn_param(pkey_.get(), OSSL_PKEY_PARAM_RSA_N, &raw) != 1) {
    throw CryptoError("Keypair: Failed to read modulus");
  }
  BnPtr n(raw);
  std::vector<uint8_t> bytes(static_cast<size_t>(BN_num_bytes(n.get())));
  BN_bn2bin(n.get(), bytes.data());
  return bytes;
}

std::string Keypair::public_pem() const {
  std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!bio || PEM_write_bio_PUBKEY(bio.get(), pkey_.get()) != 1) {
    throw CryptoError("Keypair: Failed to export public key");
  }
  char* data = nullptr;
  long length = BIO_get_mem_data(bio.get(), &data);
  return std::string(data, static_cast<size_t>(length));
}

//==============================================
// KEY DERIVATION
//==============================================

std::vector<uint8_t> derive_seed(const std::string& passphrase, const std::string& salt) {
  std::vector<uint8_t> seed(DERIVED_KEY_SIZE);
  if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                        reinterpret_cast<const unsigned char*>(salt.data()), static_cast<int>(salt.size()),
                        PBKDF2_ITERATIONS, EVP_sha256(),
                        static_cast<int>(seed.size()), seed.data()) != 1) {
    throw KeyDerivationError("PBKDF2 derivation failed");
  }
  return seed;
}

Keypair derive_keypair(const std::string& passphrase, const std::string& salt) {
  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Deriving " << Keypair::MODULUS_BITS << "-bit RSA keypair";

  CounterKeystream stream(derive_seed(passphrase, salt));
  BnCtxPtr ctx(BN_CTX_new());
  if (!ctx) {
    throw KeyDerivationError("Failed to allocate big number context");
  }

  const int bits = Keypair::MODULUS_BITS;
  auto e = bn_from_word(Keypair::PUBLIC_EXPONENT);
  auto n = bn_from_word(1);
  auto d = bn_from_word(1);
  auto half_limit = power_of_two(bits / 2);
  BnPtr p;
  BnPtr q;

  while (BN_num_bits(n.get()) != bits && BN_cmp(d.get(), half_limit.get()) < 0) {
    // p * q always lands in (2^(bits-1), 2^bits)
    const int size_q = bits / 2;
    const int size_p = bits - size_q;
    auto min_q = isqrt(power_of_two(2 * size_q - 1).get(), ctx.get());
    auto min_p = size_q != size_p ? isqrt(power_of_two(2 * size_p - 1).get(), ctx.get())
                                  : BnPtr(BN_dup(min_q.get()));

    p = generate_probable_prime(stream, size_p, [&](const BIGNUM* candidate) {
      return BN_cmp(candidate, min_p.get()) > 0 && coprime_to_exponent(candidate, e.get(), ctx.get());
    }, ctx.get());

    auto min_distance = power_of_two(bits / 2 - 100);
    auto distance = new_bn();
    q = generate_probable_prime(stream, size_q, [&](const BIGNUM* candidate) {
      if (BN_cmp(candidate, min_q.get()) <= 0 || !coprime_to_exponent(candidate, e.get(), ctx.get())) {
        return false;
      }
      check(BN_sub(distance.get(), candidate, p.get()), "distance failed");
      BN_set_negative(distance.get(), 0);
      return BN_cmp(distance.get(), min_distance.get()) > 0;
    }, ctx.get());

    check(BN_mul(n.get(), p.get(), q.get(), ctx.get()), "modulus multiplication failed");

    auto p_minus_one = BnPtr(BN_dup(p.get()));
    auto q_minus_one = BnPtr(BN_dup(q.get()));
    check(BN_sub_word(p_minus_one.get(), 1), "subtract failed");
    check(BN_sub_word(q_minus_one.get(), 1), "subtract failed");
    auto gcd = new_bn();
    auto product = new_bn();
    auto lcm = new_bn();
    check(BN_gcd(gcd.get(), p_minus_one.get(), q_minus_one.get(), ctx.get()), "gcd failed");
    check(BN_mul(product.get(), p_minus_one.get(), q_minus_one.get(), ctx.get()), "multiplication failed");
    check(BN_div(lcm.get(), nullptr, product.get(), gcd.get(), ctx.get()), "lcm division failed");

    d.reset(BN_mod_inverse(nullptr, e.get(), lcm.get(), ctx.get()));
    if (!d) {
      throw KeyDerivationError("Public exponent is not invertible");
    }
  }

  if (BN_cmp(p.get(), q.get()) > 0) {
    std::swap(p, q);
  }

  Keypair keypair(assemble_rsa_key(n.get(), e.get(), d.get(), p.get(), q.get(), ctx.get()));
  BOOST_LOG_TRIVIAL(debug) << "Key derivation: Keypair derived after " << stream.consumed() << " keystream bytes";
  return keypair;
}

} // namespace dfp::crypto
