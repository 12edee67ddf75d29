// Copyright (c) 2024, The XELIS Ledger Sign Project
// 
// All rights reserved.
// 
// Redistribution and use in source and binary forms, with or without modification, are
// permitted provided that the following conditions are met:
// 
// 1. Redistributions of source code must retain the above copyright notice, this list of
//    conditions and the following disclaimer.
// 
// 2. Redistributions in binary form must reproduce the above copyright notice, this list
//    of conditions and the following disclaimer in the documentation and/or other
//    materials provided with the distribution.
// 
// 3. Neither the name of the copyright holder nor the names of its contributors may be
//    used to endorse or promote products derived from this software without specific
//    prior written permission.
// 
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
// MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL
// THE COPYRIGHT HOLDER OR CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
// SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT,
// STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF
// THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "common/file.h"
#include "crypto/hash.h"
#include "bip32_path.h"

namespace xelis
{
  constexpr uint32_t ATTESTATION_VERSION = 1;
  constexpr size_t PUBLIC_KEY_SIZE = 32;
  constexpr size_t SIGNATURE_SIZE = 64;
  /// Signature response: length byte (always 64) followed by the signature
  constexpr size_t SIGNATURE_RESPONSE_SIZE = 1 + SIGNATURE_SIZE;

  using public_key = std::array<uint8_t, PUBLIC_KEY_SIZE>;
  using signature_half = std::array<uint8_t, SIGNATURE_SIZE / 2>;

  /// Computes the message digest recorded in an attestation
  using message_hasher = std::function<crypto::hash512(std::string_view)>;

  class attestation_error : public std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /// Record of a completed signature, binding the digest of the signed transaction to the device
  /// key and the signature it returned.
  struct attestation
  {
    uint32_t version = ATTESTATION_VERSION;
    uint64_t timestamp = 0;
    std::string bip32_path;
    public_key device_public_key{};
    uint64_t transaction_length = 0;
    crypto::hash512 message_digest = crypto::null_hash512;
    signature_half signature_first_half{};
    signature_half signature_second_half{};
    std::optional<uint64_t> blinders_count;
  };

  /// Extracts the key from a get-public-key response (`32 | key(32)`).  Throws attestation_error
  /// if the response has any other shape.
  public_key parse_public_key_response(std::string_view response);

  /*! \brief Builds the attestation for a signature response.
   *
   *  \param signature_response  device response payload; must be exactly 65 bytes starting with 64
   *  \param key                 device public key for the signing path
   *  \param message             the transaction bytes that were signed
   *  \param path                derivation path used for signing
   *  \param blinder_count       number of blinders sent, if any were sent
   *  \param hasher              message digest function
   *  \param when                attestation time
   *
   *  \throws attestation_error if the signature response is malformed
   */
  attestation build_attestation(
      std::string_view signature_response,
      const public_key& key,
      std::string_view message,
      const bip32_path& path,
      std::optional<uint64_t> blinder_count,
      const message_hasher& hasher,
      std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

  /// Pretty-printed JSON form of an attestation, fields in their documented order
  std::string to_json(const attestation& a);

  /// `<input without extension>.attest.json`
  fs::path attestation_path(const fs::path& input);

  /// Serializes `a` fully and atomically replaces `filename` with it.  Throws attestation_error if
  /// the file cannot be written.
  void write_attestation(const attestation& a, const fs::path& filename);
}
