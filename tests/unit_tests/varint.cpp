// Copyright (c) 2014-2018, The Monero Project
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

#include "common/varint.h"
#include <limits>
#include "gtest/gtest.h"

using namespace std::literals;

TEST(varint, encode)
{
  ASSERT_EQ(tools::get_varint_data(0U), "\x00"s);
  ASSERT_EQ(tools::get_varint_data(0x7fU), "\x7f"s);
  ASSERT_EQ(tools::get_varint_data(0x80U), "\x80\x01"s);
  ASSERT_EQ(tools::get_varint_data(300U), "\xac\x02"s);
  ASSERT_EQ(tools::get_varint_data(uint32_t{0xffff'ffff}), "\xff\xff\xff\xff\x0f"s);
  ASSERT_EQ(tools::get_varint_data(uint64_t{0xffff'ffff'ffff'ffff}),
      "\xff\xff\xff\xff\xff\xff\xff\xff\xff\x01"s);
  ASSERT_EQ(tools::get_varint_data(uint64_t{0xffff'ffff'ffff'ffff}).size(), tools::VARINT_MAX_LENGTH<uint64_t>);
}

TEST(varint, bundle_lengths)
{
  // Blinder section lengths are multiples of 32: 4 blinders fit one byte, 5 need two
  uint64_t len;
  ASSERT_EQ(tools::read_varint("\x00"s, len), 1);
  ASSERT_EQ(len, 0);
  ASSERT_EQ(tools::read_varint("\x60XLB1"s, len), 1);
  ASSERT_EQ(len, 3 * 32);
  ASSERT_EQ(tools::read_varint("\x80\x01"s, len), 2);
  ASSERT_EQ(len, 4 * 32);
  ASSERT_EQ(tools::read_varint("\xa0\x01"s, len), 2);
  ASSERT_EQ(len, 5 * 32);
  ASSERT_EQ(tools::read_varint("\xe0\x0f"s, len), 2);
  ASSERT_EQ(len, 63 * 32);

  // Narrow destinations
  uint16_t v16;
  ASSERT_EQ(tools::read_varint("\xff\xff\x03\x00"s, v16), 3);
  ASSERT_EQ(v16, 0xffff);
  uint8_t v8;
  ASSERT_EQ(tools::read_varint("\xff\x01\x00"s, v8), 2);
  ASSERT_EQ(v8, 0xff);
}

TEST(varint, lvalue_iterator)
{
  std::string data = "\xff\xff\x02\x00\x01\x02"s;
  auto it = data.begin(); // we pass an lvalue ref so it should get modified
  uint16_t v16;
  ASSERT_EQ(tools::read_varint(it, data.end(), v16), 3);
  ASSERT_EQ(std::distance(data.begin(), it), 3);
  ASSERT_EQ(std::string(it, data.end()), "\x00\x01\x02"s);

  const auto cit = data.begin(); // This should get copied instead
  ASSERT_EQ(tools::read_varint(cit, data.end(), v16), 3);
  ASSERT_EQ(std::distance(data.begin(), cit), 0);
  ASSERT_EQ(std::string(cit, data.end()), data);
}

TEST(varint, offset)
{
  std::string_view data = "\x05\xac\x02\x7f"sv;
  size_t offset = 0;
  uint64_t v;
  ASSERT_EQ(tools::read_varint(data, offset, v), 1);
  ASSERT_EQ(v, 5);
  ASSERT_EQ(offset, 1);
  ASSERT_EQ(tools::read_varint(data, offset, v), 2);
  ASSERT_EQ(v, 300);
  ASSERT_EQ(offset, 3);
  ASSERT_EQ(tools::read_varint(data, offset, v), 1);
  ASSERT_EQ(v, 0x7f);
  ASSERT_EQ(offset, 4);

  // Nothing left: truncated, and the offset stays put
  ASSERT_EQ(tools::read_varint(data, offset, v), tools::EVARINT_TRUNCATED);
  ASSERT_EQ(offset, 4);
  offset = 10;
  ASSERT_EQ(tools::read_varint(data, offset, v), tools::EVARINT_TRUNCATED);
  ASSERT_EQ(offset, 10);
}

TEST(varint, non_minimal)
{
  // Redundant zero continuation groups are accepted, as the device accepts them
  uint16_t v16;
  ASSERT_EQ(tools::read_varint("\xff\xff\x00"s, v16), 3);
  ASSERT_EQ(v16, 0x3fff);
  ASSERT_EQ(tools::read_varint("\x80\x80\x00"s, v16), 3);
  ASSERT_EQ(v16, 0);

  uint8_t v8;
  ASSERT_EQ(tools::read_varint("\x80\x00"s, v8), 2);
  ASSERT_EQ(v8, 0);
  ASSERT_EQ(tools::read_varint("\x85\x80\x80\x00"s, v8), 4);
  ASSERT_EQ(v8, 5);
}

TEST(varint, failures)
{
  uint64_t v64;
  ASSERT_EQ(tools::read_varint("\xff\xff\xff\xff\xff\xff\xff\xff\xff\x02"s, v64), tools::EVARINT_OVERFLOW);
  ASSERT_EQ(tools::read_varint(""s, v64), tools::EVARINT_TRUNCATED);
  ASSERT_EQ(tools::read_varint("\x80"s, v64), tools::EVARINT_TRUNCATED);
  ASSERT_EQ(tools::read_varint("\xff\xff\xff"s, v64), tools::EVARINT_TRUNCATED);

  uint16_t v16;
  ASSERT_EQ(tools::read_varint("\xff\xff\x04"s, v16), tools::EVARINT_OVERFLOW);
  ASSERT_EQ(tools::read_varint("\xff\xff\x08"s, v16), tools::EVARINT_OVERFLOW);
  ASSERT_EQ(tools::read_varint("\xff\xff\x80"s, v16), tools::EVARINT_TRUNCATED);
  ASSERT_EQ(tools::read_varint("\x80\x80\x80"s, v16), tools::EVARINT_TRUNCATED);
  ASSERT_EQ(tools::read_varint("\x80\x80\x80\x01"s, v16), tools::EVARINT_OVERFLOW);

  uint8_t v8;
  ASSERT_EQ(tools::read_varint("\xff\x02"s, v8), tools::EVARINT_OVERFLOW);
  ASSERT_EQ(tools::read_varint("\x80\x02"s, v8), tools::EVARINT_OVERFLOW);
  ASSERT_EQ(tools::read_varint("\x80\x80"s, v8), tools::EVARINT_TRUNCATED);
}

namespace {

template <typename T>
void check_round_trip(T v)
{
  std::string s = tools::get_varint_data(v);
  ASSERT_LE(s.size(), tools::VARINT_MAX_LENGTH<T>);
  T out;
  ASSERT_EQ(tools::read_varint(s, out), static_cast<int>(s.size())) << +v;
  ASSERT_EQ(out, v);
}

template <typename T>
void check_boundaries()
{
  constexpr int bits = sizeof(T) * 8;
  check_round_trip<T>(0);
  for (int i = 1; i < bits; i++)
  {
    T p = T(1) << i;
    check_round_trip<T>(p - 1);
    check_round_trip<T>(p);
    check_round_trip<T>(p + 1);
  }
  check_round_trip<T>(std::numeric_limits<T>::max());
}

}

TEST(varint, round_trip)
{
  check_boundaries<uint8_t>();
  check_boundaries<uint16_t>();
  check_boundaries<uint32_t>();
  check_boundaries<uint64_t>();

  for (uint64_t v = 0; v < 70000; v++)
    check_round_trip(v);

  uint64_t max;
  ASSERT_EQ(tools::read_varint("\xff\xff\xff\xff\xff\xff\xff\xff\xff\x01"s, max), 10);
  ASSERT_EQ(max, std::numeric_limits<uint64_t>::max());
}
