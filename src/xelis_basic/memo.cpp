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

#include "memo.h"

#include <cstring>
#include <sstream>
#include <boost/endian/conversion.hpp>
#include "common/hex.h"
#include "common/varint.h"
#include "epee/misc_log_ex.h"

#undef BELDEX_DEFAULT_LOG_CATEGORY
#define BELDEX_DEFAULT_LOG_CATEGORY "xelis.memo"

namespace xelis
{
  using namespace std::literals;

  std::string_view to_string(memo_tx_type type)
  {
    switch (type)
    {
      case memo_tx_type::burn: return "burn"sv;
      case memo_tx_type::transfer: return "transfer"sv;
      case memo_tx_type::multisig: return "multisig"sv;
      case memo_tx_type::invoke_contract: return "invoke contract"sv;
      case memo_tx_type::deploy_contract: return "deploy contract"sv;
    }
    return "unknown"sv;
  }

  namespace
  {
    uint64_t read_length(std::string_view data, size_t& offset, const char* what)
    {
      uint64_t value;
      if (tools::read_varint(data, offset, value) < 0)
        throw memo_error{"Invalid memo: bad "s + what + " varint at offset " + std::to_string(offset)};
      return value;
    }

    uint64_t load_u64_le(std::string_view data, size_t offset)
    {
      uint64_t v;
      std::memcpy(&v, data.data() + offset, sizeof(v));
      return boost::endian::little_to_native(v);
    }

    void expect_size(std::string_view value, size_t size, const char* field)
    {
      if (value.size() != size)
        throw memo_error{"Invalid memo: "s + field + " field is " + std::to_string(value.size()) +
          " bytes, expected " + std::to_string(size)};
    }

    memo_output parse_output(std::string_view val)
    {
      constexpr size_t fixed = 32 + 32 + 8;
      if (val.size() < fixed)
        throw memo_error{"Invalid memo: output item too short (" + std::to_string(val.size()) + " bytes)"};

      memo_output out;
      std::memcpy(out.asset.data(), val.data(), 32);
      std::memcpy(out.destination.data(), val.data() + 32, 32);
      out.amount = load_u64_le(val, 64);
      size_t p = fixed;
      out.extra_len = read_length(val, p, "output extra length");
      uint64_t preview_len = read_length(val, p, "output preview length");
      if (preview_len > val.size() - p)
        throw memo_error{"Invalid memo: output preview runs past the end of its item"};
      out.preview = val.substr(p, preview_len);
      return out;
    }
  }

  memo_preview parse_memo_preview(std::string_view memo)
  {
    memo_preview result;
    size_t offset = 0;
    while (offset < memo.size())
    {
      uint8_t tag = memo[offset++];
      if (tag == memo_tag::out_count)
      {
        result.declared_outputs = read_length(memo, offset, "output count");
        continue;
      }

      uint64_t len = read_length(memo, offset, "field length");
      if (len > memo.size() - offset)
        throw memo_error{"Invalid memo: field with tag " + std::to_string(tag) + " runs past the end of the memo"};
      auto value = memo.substr(offset, len);
      offset += len;

      switch (tag)
      {
        case memo_tag::tx_type:
          expect_size(value, 1, "tx type");
          result.tx_type = static_cast<uint8_t>(value[0]);
          break;
        case memo_tag::fee:
          expect_size(value, 8, "fee");
          result.fee = load_u64_le(value, 0);
          break;
        case memo_tag::nonce:
          expect_size(value, 8, "nonce");
          result.nonce = load_u64_le(value, 0);
          break;
        case memo_tag::out_item:
          result.outputs.push_back(parse_output(value));
          break;
        default:
          MDEBUG("Skipping unknown memo tag 0x" << std::hex << +tag << std::dec << " (" << len << " bytes)");
      }
    }

    if (result.declared_outputs && *result.declared_outputs != result.outputs.size())
      throw memo_error{"Invalid memo: declares " + std::to_string(*result.declared_outputs) + " outputs but contains " +
        std::to_string(result.outputs.size())};

    return result;
  }

  std::string format_memo_preview(const memo_preview& memo)
  {
    std::ostringstream s;
    s << "type: " << to_string(static_cast<memo_tx_type>(memo.tx_type)) << " (" << +memo.tx_type << ")\n"
      << "fee: " << memo.fee << "\n"
      << "nonce: " << memo.nonce << "\n"
      << "outputs: " << memo.outputs.size() << "\n";
    for (size_t i = 0; i < memo.outputs.size(); i++)
    {
      auto& o = memo.outputs[i];
      s << "  [" << i << "] " << o.amount << " of " << tools::type_to_hex(o.asset)
        << "\n      to " << tools::type_to_hex(o.destination);
      if (o.extra_len > 0)
        s << "\n      extra data: " << o.extra_len << " bytes";
      if (!o.preview.empty())
        s << "\n      preview: " << tools::abbreviated_hex(o.preview);
      s << "\n";
    }
    return s.str();
  }
}
