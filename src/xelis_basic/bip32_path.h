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

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace xelis
{
  constexpr uint32_t BIP32_HARDENED = 0x8000'0000;
  constexpr size_t BIP32_MAX_DEPTH = 10;

  /// Default derivation path of the XELIS app (coin type 587).
  constexpr std::string_view DEFAULT_BIP32_PATH = "m/44'/587'/0'/0/0";

  /// A BIP32 derivation path, sent to the device as the first frame of a signing stream.
  class bip32_path
  {
  public:
    bip32_path() = default;
    explicit bip32_path(std::vector<uint32_t> components);

    /// Parses "m/44'/587'/0'/0/0" notation; `'` or `h` marks a hardened component.  Throws
    /// std::invalid_argument on malformed input or more than BIP32_MAX_DEPTH components.
    static bip32_path parse(std::string_view text);

    /// Wire form: component count (1 byte) followed by each component as a big-endian u32.
    std::string serialize() const;

    std::string to_string() const;

    const std::vector<uint32_t>& components() const { return m_components; }
    bool operator==(const bip32_path& other) const { return m_components == other.m_components; }

  private:
    std::vector<uint32_t> m_components;
  };
}
