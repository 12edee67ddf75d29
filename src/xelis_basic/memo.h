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
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace xelis
{
  // Memo TLV tags.  Every tag except memo_tag::out_count is followed by a varint length.
  namespace memo_tag
  {
    constexpr uint8_t tx_type = 0x01;
    constexpr uint8_t fee = 0x02;
    constexpr uint8_t nonce = 0x03;
    constexpr uint8_t out_count = 0x10;
    constexpr uint8_t out_item = 0x20;
  }

  enum class memo_tx_type : uint8_t
  {
    burn = 0,
    transfer = 1,
    multisig = 2,
    invoke_contract = 3,
    deploy_contract = 4,
  };

  std::string_view to_string(memo_tx_type type);

  struct memo_output
  {
    std::array<uint8_t, 32> asset;
    std::array<uint8_t, 32> destination;
    uint64_t amount;
    uint64_t extra_len;
    std::string preview;
  };

  /// Summary of a transaction as the device will display it
  struct memo_preview
  {
    uint8_t tx_type = 0;
    uint64_t fee = 0;
    uint64_t nonce = 0;
    std::optional<uint64_t> declared_outputs;
    std::vector<memo_output> outputs;
  };

  class memo_error : public std::runtime_error
  {
    using std::runtime_error::runtime_error;
  };

  /// Parses a memo TLV.  Unknown tags are skipped.  Throws memo_error on a malformed memo or if
  /// the declared output count does not match the number of output items.
  memo_preview parse_memo_preview(std::string_view memo);

  /// Multi-line human readable rendering of a parsed memo
  std::string format_memo_preview(const memo_preview& memo);
}
