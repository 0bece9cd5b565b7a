#include "checksum.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace relay::transform {

std::string Sha256Hex(std::string_view data) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned char byte : digest) {
    oss << std::setw(2) << static_cast<int>(byte);
  }
  return oss.str();
}

} // namespace relay::transform
