#include "cfgsmith/util/digest.hpp"

#include <openssl/evp.h>

#include <array>

namespace cfgsmith::util {

auto content_hash(std::string_view data) -> std::string {
  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;

  EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
             EVP_sha256(), nullptr);

  static constexpr std::string_view kHex = "0123456789abcdef";
  std::string out;
  out.reserve(static_cast<std::size_t>(digest_len) * 2);
  for (unsigned int i = 0; i < digest_len; ++i) {
    out.push_back(kHex[digest[i] >> 4]);
    out.push_back(kHex[digest[i] & 0x0f]);
  }
  return out;
}

} // namespace cfgsmith::util
