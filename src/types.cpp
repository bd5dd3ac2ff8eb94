#include "types.hpp"

const char *crypto_suite_name(CryptoSuite suite) {
  switch (suite) {
  case CryptoSuite::AES_CM_128_HMAC_SHA1_80:
    return "AES_CM_128_HMAC_SHA1_80";
  case CryptoSuite::AES_256_CM_HMAC_SHA1_80:
    return "AES_256_CM_HMAC_SHA1_80";
  case CryptoSuite::NONE:
    return "NONE";
  default:
    return "unknown";
  }
}

CryptoSuite crypto_suite_from_id(int id) {
  switch (id) {
  case 0:
    return CryptoSuite::AES_CM_128_HMAC_SHA1_80;
  case 1:
    return CryptoSuite::AES_256_CM_HMAC_SHA1_80;
  case 2:
    return CryptoSuite::NONE;
  default:
    return CryptoSuite::UNKNOWN;
  }
}

bool crypto_suite_supported(CryptoSuite suite) {
  return suite == CryptoSuite::AES_CM_128_HMAC_SHA1_80;
}

const char *address_family_label(AddressFamily family) {
  return family == AddressFamily::V6 ? "ipv6" : "ipv4";
}
