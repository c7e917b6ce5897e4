#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace dfp::crypto {

namespace {

using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

MdCtxPtr make_md5_context() {
  MdCtxPtr ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
  if (!ctx) {
    throw CryptoError("Digest: Failed to create hash context");
  }
  if (!EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr)) {
    throw CryptoError("Digest: Failed to initialize hash context");
  }
  return ctx;
}

std::string finish_hex(EVP_MD_CTX* ctx) {
  unsigned char hash[EVP_MAX_MD_SIZE];
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(ctx, hash, &hash_len)) {
    throw CryptoError("Digest: Failed to finalize hash");
  }

  // Convert the raw hash bytes to a hexadecimal string
  std::stringstream ss;
  for (unsigned int i = 0; i < hash_len; i++) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
  }
  return ss.str();
}

} // namespace

std::string md5_hex(const std::string& data) {
  auto ctx = make_md5_context();
  if (!EVP_DigestUpdate(ctx.get(), data.data(), data.size())) {
    throw CryptoError("Digest: Failed to update hash");
  }
  return finish_hex(ctx.get());
}

std::string md5_hex(std::istream& input) {
  auto ctx = make_md5_context();
  char buffer[64 * 1024];

  // Read input stream in blocks and feed the digest
  while (input.read(buffer, sizeof(buffer)) || input.gcount() > 0) {
    if (!EVP_DigestUpdate(ctx.get(), buffer, static_cast<size_t>(input.gcount()))) {
      throw CryptoError("Digest: Failed to update hash");
    }
  }
  if (input.bad()) {
    throw CryptoError("Digest: Read error while hashing stream");
  }
  return finish_hex(ctx.get());
}

std::string md5_file(const std::filesystem::path& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Digest: Failed to open file: " << path.string();
    throw CryptoError("Digest: Failed to open file: " + path.string());
  }
  std::string digest = md5_hex(file);
  BOOST_LOG_TRIVIAL(debug) << "Digest: MD5 of " << path.string() << " is " << digest;
  return digest;
}

} // namespace dfp::crypto
