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

#include "bundle.h"

#include <algorithm>
#include <iterator>
#include "common/varint.h"
#include "epee/misc_log_ex.h"

#undef BELDEX_DEFAULT_LOG_CATEGORY
#define BELDEX_DEFAULT_LOG_CATEGORY "xelis.bundle"

namespace xelis
{
  std::string_view to_string(bundle_errc code)
  {
    switch (code)
    {
      case bundle_errc::not_a_bundle: return "not a bundle"sv;
      case bundle_errc::truncated_input: return "truncated input"sv;
      case bundle_errc::invalid_length: return "invalid length"sv;
      case bundle_errc::unsupported_version: return "unsupported version"sv;
      case bundle_errc::varint_overflow: return "length overflow"sv;
    }
    return "unknown error"sv;
  }

  bundle_error::bundle_error(bundle_errc code, const std::string& what)
    : std::runtime_error{std::string{to_string(code)} + ": " + what}, m_code{code}
  {}

  namespace
  {
    uint64_t read_length(std::string_view data, size_t& offset, const char* field)
    {
      uint64_t value;
      int read = tools::read_varint(data, offset, value);
      if (read == tools::EVARINT_OVERFLOW)
        throw bundle_error{bundle_errc::varint_overflow, std::string{field} + " does not fit in 64 bits"};
      if (read < 0)
        throw bundle_error{bundle_errc::truncated_input, std::string{field} + " is cut off at offset " + std::to_string(offset)};
      return value;
    }

    std::string_view take(std::string_view data, size_t& offset, uint64_t len, const char* field)
    {
      if (offset > data.size() || len > data.size() - offset)
        throw bundle_error{bundle_errc::truncated_input, std::string{field} + " needs " + std::to_string(len) +
          " bytes but only " + std::to_string(data.size() - std::min(offset, data.size())) + " remain"};
      auto piece = data.substr(offset, len);
      offset += len;
      return piece;
    }
  }

  bool looks_like_bundle(std::string_view data)
  {
    return data.size() >= BUNDLE_MIN_SIZE && data.substr(0, BUNDLE_MAGIC.size()) == BUNDLE_MAGIC;
  }

  bundle decode_bundle(std::string_view data)
  {
    if (!looks_like_bundle(data))
      throw bundle_error{bundle_errc::not_a_bundle, "missing " + std::string{BUNDLE_MAGIC} + " signature"};

    bundle b;
    size_t offset = BUNDLE_MAGIC.size();
    b.version = static_cast<uint8_t>(data[offset++]);
    if (b.version < 1)
      throw bundle_error{bundle_errc::unsupported_version, "bundle version " + std::to_string(b.version) + " is no longer supported"};

    uint64_t memo_len = read_length(data, offset, "memo length");
    b.memo = take(data, offset, memo_len, "memo");

    uint64_t blinders_len = read_length(data, offset, "blinders length");
    if (blinders_len % BLINDER_SIZE != 0)
      throw bundle_error{bundle_errc::invalid_length, "blinders section of " + std::to_string(blinders_len) +
        " bytes is not a multiple of " + std::to_string(BLINDER_SIZE)};
    auto blinder_bytes = take(data, offset, blinders_len, "blinders");

    b.blinders.resize(blinder_bytes.size() / BLINDER_SIZE);
    for (size_t i = 0; i < b.blinders.size(); i++)
      std::copy_n(blinder_bytes.begin() + i * BLINDER_SIZE, BLINDER_SIZE, b.blinders[i].begin());

    b.transaction = data.substr(offset);

    MDEBUG("Decoded v" << +b.version << " bundle: memo " << b.memo.size() << " bytes, "
        << b.blinders.size() << " blinders, transaction " << b.transaction.size() << " bytes");
    return b;
  }

  std::string encode_bundle(const bundle& b)
  {
    std::string out;
    out.reserve(BUNDLE_MIN_SIZE + 2*tools::VARINT_MAX_LENGTH<uint64_t> + b.memo.size() +
        b.blinders.size() * BLINDER_SIZE + b.transaction.size());
    out += BUNDLE_MAGIC;
    out += static_cast<char>(b.version);
    tools::write_varint(std::back_inserter(out), static_cast<uint64_t>(b.memo.size()));
    out += b.memo;
    tools::write_varint(std::back_inserter(out), static_cast<uint64_t>(b.blinders.size() * BLINDER_SIZE));
    for (auto& bl : b.blinders)
      out.append(reinterpret_cast<const char*>(bl.data()), bl.size());
    out += b.transaction;
    return out;
  }

  bundle_input load_bundle_or_raw(std::string_view data)
  {
    if (looks_like_bundle(data))
      return {true, decode_bundle(data)};

    MDEBUG("Input has no " << BUNDLE_MAGIC << " signature; treating all " << data.size() << " bytes as a bare transaction");
    bundle_input raw{false, {}};
    raw.contents.transaction = data;
    return raw;
  }
}
