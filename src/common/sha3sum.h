#pragma once
#include <string_view>

namespace crypto { struct hash512; }

namespace tools {

  // Calculates the SHA3-512 digest of the given data.  Returns false if the hash backend fails.
  bool sha3_512_str(std::string_view str, crypto::hash512& hash);

  // Throwing variant, suitable as the default message digest of an attestation.
  crypto::hash512 sha3_512(std::string_view data);

}
