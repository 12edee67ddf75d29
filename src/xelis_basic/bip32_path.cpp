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

#include "bip32_path.h"

#include <charconv>
#include <stdexcept>
#include <boost/endian/conversion.hpp>

namespace xelis
{
  bip32_path::bip32_path(std::vector<uint32_t> components) : m_components{std::move(components)}
  {
    if (m_components.size() > BIP32_MAX_DEPTH)
      throw std::invalid_argument{"BIP32 path is too deep: " + std::to_string(m_components.size()) + " components"};
  }

  bip32_path bip32_path::parse(std::string_view text)
  {
    if (text.size() < 1 || text[0] != 'm')
      throw std::invalid_argument{"BIP32 path must start with 'm': " + std::string{text}};
    text.remove_prefix(1);

    std::vector<uint32_t> components;
    while (!text.empty())
    {
      if (text[0] != '/')
        throw std::invalid_argument{"Invalid BIP32 path separator in: " + std::string{text}};
      text.remove_prefix(1);

      auto end = text.find('/');
      std::string_view part = text.substr(0, end);
      text.remove_prefix(part.size());

      bool hardened = false;
      if (!part.empty() && (part.back() == '\'' || part.back() == 'h' || part.back() == 'H'))
      {
        hardened = true;
        part.remove_suffix(1);
      }

      uint32_t index = 0;
      auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), index);
      if (part.empty() || ec != std::errc{} || ptr != part.data() + part.size() || index >= BIP32_HARDENED)
        throw std::invalid_argument{"Invalid BIP32 path component: " + std::string{part}};

      components.push_back(hardened ? (index | BIP32_HARDENED) : index);
    }

    return bip32_path{std::move(components)};
  }

  std::string bip32_path::serialize() const
  {
    std::string out;
    out.reserve(1 + 4 * m_components.size());
    out += static_cast<char>(m_components.size());
    for (uint32_t c : m_components)
    {
      boost::endian::native_to_big_inplace(c);
      out.append(reinterpret_cast<const char*>(&c), sizeof(c));
    }
    return out;
  }

  std::string bip32_path::to_string() const
  {
    std::string out{"m"};
    for (uint32_t c : m_components)
    {
      out += '/';
      out += std::to_string(c & ~BIP32_HARDENED);
      if (c & BIP32_HARDENED)
        out += '\'';
    }
    return out;
  }
}
