#include <flightledger/common/critical.hpp>
#include <flightledger/crypto/sha256.hpp>

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>

namespace flightledger::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using evp_md_ptr = std::unique_ptr<EVP_MD, decltype(&EVP_MD_free)>;

evp_md_ptr fetch_sha256() {
  return evp_md_ptr{EVP_MD_fetch(nullptr, "SHA256", nullptr), EVP_MD_free};
}

}  // namespace

bool sha256_available() {
  static const auto available_now = static_cast<bool>(fetch_sha256());
  return available_now;
}

flightledger::schema::hash32_t sha256(
    const flightledger::schema::bytes_view_t& bytes) {
  auto md = fetch_sha256();
  if (!md) {
    flightledger::common::critical("OpenSSL does not provide SHA256");
  }

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    flightledger::common::critical("failed to allocate EVP_MD_CTX");
  }

  auto output = flightledger::schema::hash32_t{};
  auto output_size = static_cast<unsigned int>(output.size());
  if (EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &output_size) != 1 ||
      output_size != output.size()) {
    flightledger::common::critical("OpenSSL SHA256 digest failed: {}",
                                   ERR_error_string(ERR_get_error(), nullptr));
  }
  return output;
}

}  // namespace flightledger::crypto
