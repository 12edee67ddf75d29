// Copyright (c) 2024, The XELIS Ledger Sign Project
// Copyright (c) 2018-2020, The Beldex Project
// Copyright (c) 2014-2019, The Monero Project
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
// 
// Parts of this file are originally copyright (c) 2012-2013 The Cryptonote developers

#pragma once

#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <type_traits>

/*! \file varint.h
 * \brief unsigned base-128 length prefixes
 *
 * Bundle length fields and memo TLV values are little-endian base-128 integers: each byte carries
 * the next 7 significant bits of the value, and the high bit of the byte is a continuation flag
 * (1 = another byte follows, 0 = this is the last byte).
 *
 *     value       encoded bytes
 *     =====       =============
 *     0x64        \x64
 *     0x80        \x80\x01
 *     0xcc        \xcc\x01
 *     0xbf04      \x84\xfe\x02
 *
 * Decoding accepts non-minimal encodings (e.g. \x80\x00 for 0) because the device does, but never
 * wraps: a value that does not fit the destination integer is reported as an overflow.
 */

namespace tools {

  /// Returned by read_varint when the value does not fit into the destination type
  constexpr int EVARINT_OVERFLOW = -1;
  /// Returned by read_varint if the input ends before a byte without the continuation bit
  constexpr int EVARINT_TRUNCATED = -3;

  // Maximum number of bytes of a minimally varint-encoded integer of the given type.
  template <typename T>
  constexpr size_t VARINT_MAX_LENGTH = (sizeof(T) * 8 + 6) / 7;

  /*! \brief writes a varint to an output iterator.  Only supports unsigned integer types.
   */
  template <typename OutputIt, typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>, int> = 0>
  void write_varint(OutputIt&& it, T i) {
    while (i > 0b0111'1111) {
      *it++ = static_cast<char>((i & 0b0111'1111) | 0b1000'0000);
      i >>= 7;
    }
    *it++ = static_cast<char>(i);
  }

  /*! \brief Returns the encoded bytes of `v`
   */
  template <typename T>
  std::string get_varint_data(const T& v)
  {
    std::string result;
    write_varint(std::back_insert_iterator{result}, v);
    return result;
  }

  /*! \brief reads the varint pointed to by `it` into `write`.  `it` is advanced past the bytes
   * that were read.  Returns the number of bytes read on success, or EVARINT_TRUNCATED /
   * EVARINT_OVERFLOW on failure.
   */
  template <typename It, typename EndIt, typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>, int> = 0>
  int read_varint(It&& it, const EndIt& end, T& write) {
    constexpr size_t bits = sizeof(T) * 8;

    bool more = true;
    int read = 0;
    write = 0;
    for (size_t shift = 0; more && it != end; shift += 7)
    {
      auto byte = static_cast<unsigned char>(*it++);
      ++read;

      more = byte & 0b1000'0000;
      unsigned char payload = byte & 0b0111'1111;

      if (shift >= bits)
      {
        // Zero padding past the width of T is harmless; anything else cannot be represented.
        if (payload != 0)
          return EVARINT_OVERFLOW;
        continue;
      }

      if (size_t bits_avail = bits - shift; bits_avail < 7 && (payload >> bits_avail) != 0)
        return EVARINT_OVERFLOW;

      write |= static_cast<T>(payload) << shift;
    }

    return more ? EVARINT_TRUNCATED : read;
  }

  // Overload so read_varint can be called with a const iterator (which is copied, not advanced)
  template <typename It, typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>, int> = 0>
  auto read_varint(const It& it_, const It& end, T& i) { return read_varint(It{it_}, end, i); }

  /*! \brief reads the varint at the start of `s` into `write`. Returns the number of bytes
   * consumed, or an error value (as above).
   */
  template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>, int> = 0>
  int read_varint(std::string_view s, T& write) {
    return read_varint(s.begin(), s.end(), write);
  }

  /*! \brief reads the varint starting at `offset` in `s`.  On success `offset` is moved past the
   * varint and the (positive) byte count is returned; on failure `offset` is left untouched.
   */
  template <typename T, std::enable_if_t<std::is_integral_v<T> && std::is_unsigned_v<T>, int> = 0>
  int read_varint(std::string_view s, size_t& offset, T& write) {
    if (offset > s.size())
      return EVARINT_TRUNCATED;
    int read = read_varint(s.substr(offset), write);
    if (read > 0)
      offset += read;
    return read;
  }
}
