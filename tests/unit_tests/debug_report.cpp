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

#include "gtest/gtest.h"

#include <oxenmq/variant.h>
#include "device/debug_report.hpp"

using namespace std::literals;
using namespace hw::ledger;

namespace {

std::string bytes(std::initializer_list<int> b)
{
  std::string out;
  for (int x : b)
    out += static_cast<char>(x);
  return out;
}

const std::string derivation_ok = bytes({0xBD, 0xD4, 0x01})
  + std::string(8, '\x11') + bytes({0x01}) + std::string(8, '\x22') + bytes({0x01}) + std::string(8, '\x33')
  + bytes({0xDD});
const std::string keys_ok = bytes({0xF6, 0xA1, 0x01, 0x01, 0xA2, 0x01, 0x01, 0xA3, 0x01, 0x01, 0xA4, 0x01, 0x01, 0xAA});
const std::string addresses_ok = bytes({0xAD, 0xB1, 0x01, 0x01, 0xB2, 0x01, 0x01, 0xB3, 0x01, 0x01, 0xB4, 0x01, 0x01, 0xAF});

report_fixture fixture()
{
  return {{
    {0xA1, 0xB1, "Private key = 1", "8c9240b456a9e6dc65c377a1048d745f94a08cdb7f44cbcd7b46f34048871134",
      "xel:3jfypdzk48ndcewrw7ssfrt5t722prxm0azvhntmgme5qjy8zy6qqckgjqg",
      "xet:3jfypdzk48ndcewrw7ssfrt5t722prxm0azvhntmgme5qjy8zy6qqq9zzvk"},
    {0xA2, 0xB2, "Private key = 2", "f05bc1df2831717c2992d85b57e0cf3d123fd6c254257de5f784be369747b249",
      "xel:7pdurhegx9chc2vjmpd40cx085frl4kz2sjhme0hsjlrd968kfysq434xga",
      "xet:7pdurhegx9chc2vjmpd40cx085frl4kz2sjhme0hsjlrd968kfysqdzlkyr"},
  }};
}

template <typename T>
const T& section(const debug_report& r, size_t i)
{
  return var::get<T>(r.sections.at(i));
}

}

TEST(debug_report, full_pass)
{
  auto r = decode_report(bytes({0x2C}) + derivation_ok + keys_ok + addresses_ok);
  ASSERT_TRUE(r.known_kind());
  EXPECT_TRUE(r.annotations.empty());
  ASSERT_EQ(r.sections.size(), 3);

  auto& d = section<derivation_debug>(r, 0);
  ASSERT_TRUE(d.test);
  EXPECT_TRUE(d.test->derived);
  EXPECT_EQ(d.test->raw_key, std::string(8, '\x11'));
  EXPECT_EQ(d.test->reduce_marker, 0x01);
  EXPECT_EQ(d.test->clamped_key, std::string(8, '\x22'));
  EXPECT_EQ(d.test->public_key_derived, true);
  EXPECT_EQ(d.test->public_key, std::string(8, '\x33'));
  EXPECT_TRUE(d.terminated);
  EXPECT_TRUE(d.unannotated.empty());

  auto& k = section<key_matrix>(r, 1);
  ASSERT_EQ(k.cases.size(), 4);
  for (auto& c : k.cases)
    EXPECT_EQ(c.outcome(), test_outcome::pass);
  EXPECT_EQ(k.cases[3].marker, 0xA4);
  EXPECT_TRUE(k.terminated);

  auto& a = section<address_matrix>(r, 2);
  ASSERT_EQ(a.cases.size(), 4);
  for (auto& c : a.cases)
  {
    ASSERT_TRUE(c.mainnet);
    ASSERT_TRUE(c.testnet);
    EXPECT_EQ(c.mainnet->outcome(), test_outcome::pass);
    EXPECT_EQ(c.testnet->outcome(), test_outcome::pass);
  }
  EXPECT_TRUE(a.terminated);
  EXPECT_TRUE(r.all_passed());

  auto text = format_report(r, fixture());
  EXPECT_NE(text.find("DEVICE SELF-TESTS"), std::string::npos);
  EXPECT_NE(text.find("Private key = 2"), std::string::npos);
  EXPECT_NE(text.find("unknown case"), std::string::npos); // A3/A4 are not in this fixture
  EXPECT_NE(text.find("All tests passed"), std::string::npos);
}

TEST(debug_report, unknown_kind)
{
  auto r = decode_report(bytes({0x42, 0xBD, 0xDD}));
  EXPECT_FALSE(r.known_kind());
  ASSERT_EQ(r.kind, 0x42);
  ASSERT_EQ(r.annotations.size(), 1);
  ASSERT_EQ(r.sections.size(), 1);
  auto& tail = section<unparsed_tail>(r, 0);
  EXPECT_EQ(tail.offset, 1);
  EXPECT_EQ(tail.bytes, bytes({0xBD, 0xDD}));
  EXPECT_FALSE(r.all_passed());
  EXPECT_NE(format_report(r, fixture()).find("UNKNOWN REPORT KIND 0x42"), std::string::npos);

  auto empty = decode_report(""sv);
  EXPECT_FALSE(empty.kind);
  EXPECT_TRUE(empty.sections.empty());
  EXPECT_EQ(empty.annotations.size(), 1);
}

TEST(debug_report, derivation_failures)
{
  // BIP32 failed, followed by unannotated diagnostic bytes before the terminator
  auto r = decode_report(bytes({0x2C, 0xBD, 0xD4, 0x00, 0x12, 0x34, 0xDD}) + keys_ok);
  ASSERT_EQ(r.sections.size(), 2);
  auto& d = section<derivation_debug>(r, 0);
  ASSERT_TRUE(d.test);
  EXPECT_FALSE(d.test->derived);
  EXPECT_EQ(d.unannotated, bytes({0x12, 0x34}));
  EXPECT_TRUE(d.terminated);
  EXPECT_FALSE(r.all_passed());

  // Public key derivation failed: no public key excerpt follows
  r = decode_report(bytes({0x2C, 0xBD, 0xD4, 0x01}) + std::string(8, 'r') + bytes({0x01}) + std::string(8, 'c')
      + bytes({0x00, 0xDD}));
  auto& d2 = section<derivation_debug>(r, 0);
  EXPECT_EQ(d2.test->public_key_derived, false);
  EXPECT_TRUE(d2.test->public_key.empty());
  EXPECT_TRUE(d2.terminated);

  // Key matrix marker ends an unterminated derivation section without being consumed
  r = decode_report(bytes({0x2C, 0xBD, 0x55}) + keys_ok);
  ASSERT_EQ(r.sections.size(), 2);
  EXPECT_FALSE(section<derivation_debug>(r, 0).terminated);
  EXPECT_FALSE(section<derivation_debug>(r, 0).test);
  EXPECT_EQ(section<key_matrix>(r, 1).cases.size(), 4);
  EXPECT_FALSE(r.annotations.empty());

  // Cut off inside the raw key excerpt
  r = decode_report(bytes({0x2C, 0xBD, 0xD4, 0x01, 0xAB, 0xCD}));
  auto& d3 = section<derivation_debug>(r, 0);
  EXPECT_TRUE(d3.test->truncated);
  EXPECT_EQ(d3.test->raw_key, bytes({0xAB, 0xCD}));
  EXPECT_FALSE(d3.terminated);
}

TEST(debug_report, key_matrix_outcomes)
{
  auto r = decode_report(bytes({0x2C, 0xF6, 0xA1, 0x01, 0x00, 0xA2, 0x00, 0xA3, 0x01, 0x01, 0xAA}));
  auto& k = section<key_matrix>(r, 0);
  ASSERT_EQ(k.cases.size(), 3);
  EXPECT_EQ(k.cases[0].outcome(), test_outcome::mismatch);
  EXPECT_EQ(k.cases[1].outcome(), test_outcome::fail);
  EXPECT_FALSE(k.cases[1].matches);
  EXPECT_EQ(k.cases[2].outcome(), test_outcome::pass);
  EXPECT_FALSE(r.all_passed());

  auto text = format_report(r, fixture());
  EXPECT_NE(text.find("MISMATCH"), std::string::npos);
  EXPECT_NE(text.find("8c9240b456a9e6dc65c377a1048d745f94a08cdb7f44cbcd7b46f34048871134"), std::string::npos);
}

TEST(debug_report, address_mismatch)
{
  // Mainnet mismatch with debug bytes, testnet pass; then a case with a hard failure and no testnet
  auto report = bytes({0x2C, 0xAD, 0xB1, 0x00, 63, 63}) + "xel:3jfz"s + bytes({0x01, 0xB2, 0xFF, 0xAF});
  auto r = decode_report(report);
  EXPECT_TRUE(r.annotations.empty());
  auto& a = section<address_matrix>(r, 0);
  ASSERT_EQ(a.cases.size(), 2);

  auto& m = *a.cases[0].mainnet;
  EXPECT_EQ(m.outcome(), test_outcome::mismatch);
  EXPECT_EQ(m.actual_len, 63);
  EXPECT_EQ(m.expected_len, 63);
  EXPECT_EQ(m.excerpt, "xel:3jfz"s);
  EXPECT_FALSE(m.truncated);
  EXPECT_EQ(a.cases[0].testnet->outcome(), test_outcome::pass);

  EXPECT_EQ(a.cases[1].mainnet->outcome(), test_outcome::fail);
  EXPECT_FALSE(a.cases[1].testnet);
  EXPECT_TRUE(a.terminated);

  auto text = format_report(r, fixture());
  EXPECT_NE(text.find("\"xel:3jfz\""), std::string::npos);
  EXPECT_NE(text.find("xel:3jfypdzk48ndcewrw7ssfrt5t722prxm0azvhntmgme5qjy8zy6qqckgjqg"), std::string::npos);

  // Short actual length: only that many excerpt bytes
  r = decode_report(bytes({0x2C, 0xAD, 0xB1, 0x00, 3, 63}) + "xel"s + bytes({0x00, 2, 63}) + "xe"s + bytes({0xAF}));
  auto& s = section<address_matrix>(r, 0);
  EXPECT_EQ(s.cases[0].mainnet->excerpt, "xel"s);
  EXPECT_EQ(s.cases[0].testnet->excerpt, "xe"s);
  EXPECT_TRUE(s.terminated);
}

TEST(debug_report, truncated_excerpt)
{
  auto r = decode_report(bytes({0x2C, 0xAD, 0xB1, 0x00, 63, 63}) + "xel"s);
  auto& a = section<address_matrix>(r, 0);
  ASSERT_EQ(a.cases.size(), 1);
  auto& m = *a.cases[0].mainnet;
  EXPECT_TRUE(m.truncated);
  EXPECT_EQ(m.excerpt, "xel"s);
  EXPECT_FALSE(a.terminated);
  EXPECT_GE(r.annotations.size(), 2);

  r = decode_report(bytes({0x2C, 0xAD, 0xB1, 0x00, 63}));
  auto& m2 = *section<address_matrix>(r, 0).cases[0].mainnet;
  EXPECT_TRUE(m2.truncated);
  EXPECT_FALSE(m2.expected_len);
}

TEST(debug_report, unknown_section)
{
  auto r = decode_report(bytes({0x2C}) + keys_ok + bytes({0x99, 0x01, 0x02}));
  ASSERT_EQ(r.sections.size(), 2);
  auto& tail = section<unparsed_tail>(r, 1);
  EXPECT_EQ(tail.offset, 1 + keys_ok.size());
  EXPECT_EQ(tail.bytes, bytes({0x99, 0x01, 0x02}));
  EXPECT_FALSE(r.all_passed());
  EXPECT_NE(format_report(r, fixture()).find("Unparsed data"), std::string::npos);
}

TEST(debug_report, matrices_skip_stray_bytes)
{
  auto r = decode_report(bytes({0x2C,
        0xF6, 0xA1, 0x01, 0x01, 0x55, 0x66, 0xA2, 0x01, 0x01, 0x77, 0xAA,
        0xAD, 0xB1, 0x01, 0x01, 0x99, 0xB2, 0x01, 0x01, 0xAF}));
  ASSERT_EQ(r.sections.size(), 2u);

  auto& k = section<key_matrix>(r, 0);
  ASSERT_EQ(k.cases.size(), 2u);
  EXPECT_EQ(k.cases[0].marker, 0xA1);
  EXPECT_EQ(k.cases[1].marker, 0xA2);
  EXPECT_EQ(k.cases[1].outcome(), test_outcome::pass);
  EXPECT_EQ(k.unannotated, bytes({0x55, 0x66, 0x77}));
  EXPECT_TRUE(k.terminated);

  auto& a = section<address_matrix>(r, 1);
  ASSERT_EQ(a.cases.size(), 2u);
  EXPECT_EQ(a.cases[0].marker, 0xB1);
  ASSERT_TRUE(a.cases[0].testnet);
  EXPECT_EQ(a.cases[0].testnet->outcome(), test_outcome::pass);
  EXPECT_EQ(a.cases[1].marker, 0xB2);
  EXPECT_EQ(a.unannotated, bytes({0x99}));
  EXPECT_TRUE(a.terminated);

  // Stray bytes are reported, so the run does not count as clean
  EXPECT_EQ(r.annotations.size(), 2u);
  EXPECT_FALSE(r.all_passed());
}
