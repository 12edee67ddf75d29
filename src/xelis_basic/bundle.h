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
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xelis
{
  using namespace std::literals;

  /// Container signature of an unsigned transaction bundle
  constexpr std::string_view BUNDLE_MAGIC = "XLB1"sv;
  /// Bundle layout version written by encode_bundle; every version >= 1 uses this layout
  constexpr uint8_t BUNDLE_VERSION = 1;
  /// Smallest input that can be a bundle: magic, version and at least one length byte
  constexpr size_t BUNDLE_MIN_SIZE = 6;
  constexpr size_t BLINDER_SIZE = 32;

  /// Opaque 32-byte commitment blinding secret.  Never logged.
  using blinder = std::array<uint8_t, BLINDER_SIZE>;

  struct bundle
  {
    uint8_t version = BUNDLE_VERSION;
    std::string memo;
    std::vector<blinder> blinders;
    std::string transaction;

    bool operator==(const bundle& o) const
    {
      return version == o.version && memo == o.memo && blinders == o.blinders && transaction == o.transaction;
    }
    bool operator!=(const bundle& o) const { return !(*this == o); }
  };

  enum class bundle_errc
  {
    not_a_bundle,
    truncated_input,
    invalid_length,
    unsupported_version,
    varint_overflow,
  };

  std::string_view to_string(bundle_errc code);

  class bundle_error : public std::runtime_error
  {
  public:
    bundle_error(bundle_errc code, const std::string& what);
    bundle_errc code() const { return m_code; }
  private:
    bundle_errc m_code;
  };

  /// True if `data` carries the bundle signature.  Anything else is a bare transaction.
  bool looks_like_bundle(std::string_view data);

  /*! \brief Decodes a bundle: magic(4) | version(1) | memo_len(varint) | memo |
   *  blinders_len(varint) | blinders | transaction(remainder).
   *
   *  \throws bundle_error if `data` is not a bundle (not_a_bundle), if the version is not supported
   *  (version 0), if a length runs past the end of the input, or if the blinder section is not a
   *  whole number of 32-byte blinders.
   */
  bundle decode_bundle(std::string_view data);

  /// Encodes `b` in the version-1 layout.  `b.version` is written as-is.
  std::string encode_bundle(const bundle& b);

  struct bundle_input
  {
    bool was_bundle;
    bundle contents;
  };

  /// Classifies `data` and decodes it.  Input without the bundle signature becomes a bare
  /// transaction with an empty memo and no blinders; input with the signature must decode
  /// cleanly (decode errors propagate).
  bundle_input load_bundle_or_raw(std::string_view data);
}
