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

#include <cstring>

#include <oxenmq/hex.h>
#include "common/file.h"
#include "common/sha3sum.h"
#include "xelis_basic/attestation.h"

using namespace std::literals;

namespace {

std::string signature_response()
{
  std::string resp = "\x40"s;
  for (int i = 0; i < 64; i++)
    resp += static_cast<char>(i);
  return resp;
}

xelis::public_key test_key()
{
  xelis::public_key k;
  k.fill(0x5a);
  return k;
}

crypto::hash512 fixed_hasher(std::string_view)
{
  crypto::hash512 h;
  std::memset(h.data, 0xee, sizeof(h.data));
  return h;
}

const auto path = xelis::bip32_path::parse(xelis::DEFAULT_BIP32_PATH);
const auto when = std::chrono::system_clock::time_point{std::chrono::seconds{1700000000}};

}

TEST(attestation, sha3_512)
{
  EXPECT_EQ(tools::type_to_hex(tools::sha3_512(""sv)),
      "a69f73cca23a9ac5c8b567dc185a756e97c982164fe25859e0d1dcc1475c80a6"
      "15b2123af1f5f94c11e3e9402c3ac558f500199d95b6d3e301758586281dcd26");
  EXPECT_EQ(tools::type_to_hex(tools::sha3_512("abc"sv)),
      "b751850b1a57168a5693cd924b6b096e08f621827444f70d884f5d0240d2712e"
      "10e116e9192af3c91a7ec57647e3934057340b4cf408d5a56592f8274eec53f0");
}

TEST(attestation, build)
{
  auto a = xelis::build_attestation(signature_response(), test_key(), "transaction bytes"sv, path, std::nullopt,
      tools::sha3_512, when);
  EXPECT_EQ(a.version, 1);
  EXPECT_EQ(a.timestamp, 1700000000);
  EXPECT_EQ(a.bip32_path, "m/44'/587'/0'/0/0");
  EXPECT_EQ(a.device_public_key, test_key());
  EXPECT_EQ(a.transaction_length, 17);
  EXPECT_EQ(a.message_digest, tools::sha3_512("transaction bytes"sv));
  EXPECT_EQ(a.signature_first_half[0], 0);
  EXPECT_EQ(a.signature_first_half[31], 31);
  EXPECT_EQ(a.signature_second_half[0], 32);
  EXPECT_EQ(a.signature_second_half[31], 63);
  EXPECT_FALSE(a.blinders_count);

  auto b = xelis::build_attestation(signature_response(), test_key(), "tx"sv, path, 3, fixed_hasher, when);
  EXPECT_EQ(b.blinders_count, 3);
  EXPECT_EQ(tools::type_to_hex(b.message_digest), std::string(128, 'e'));
}

TEST(attestation, malformed_signature)
{
  auto sig = signature_response();
  // Missing the length prefix
  EXPECT_THROW(xelis::build_attestation(sig.substr(1), test_key(), "tx"sv, path, std::nullopt, tools::sha3_512),
      xelis::attestation_error);
  // Too long
  EXPECT_THROW(xelis::build_attestation(sig + "\x00"s, test_key(), "tx"sv, path, std::nullopt, tools::sha3_512),
      xelis::attestation_error);
  // Wrong length prefix
  sig[0] = 65;
  EXPECT_THROW(xelis::build_attestation(sig, test_key(), "tx"sv, path, std::nullopt, tools::sha3_512),
      xelis::attestation_error);
  EXPECT_THROW(xelis::build_attestation(""sv, test_key(), "tx"sv, path, std::nullopt, tools::sha3_512),
      xelis::attestation_error);
}

TEST(attestation, public_key_response)
{
  auto key = xelis::parse_public_key_response("\x20"s + std::string(32, '\x5a'));
  EXPECT_EQ(key, test_key());
  EXPECT_THROW(xelis::parse_public_key_response(std::string(32, '\x5a')), xelis::attestation_error);
  EXPECT_THROW(xelis::parse_public_key_response("\x21"s + std::string(32, '\x5a')), xelis::attestation_error);
  EXPECT_THROW(xelis::parse_public_key_response("\x20"s + std::string(33, '\x5a')), xelis::attestation_error);
}

TEST(attestation, json)
{
  auto a = xelis::build_attestation(signature_response(), test_key(), "tx"sv, path, 2, fixed_hasher, when);
  auto json = xelis::to_json(a);

  // Fields appear in their documented order
  size_t last = 0;
  for (auto field : {"\"version\": 1", "\"timestamp\": 1700000000", "\"bip32_path\": \"m/44'/587'/0'/0/0\"",
        "\"device_public_key_hex\"", "\"transaction_length\": 2", "\"message_digest_hex\"", "\"signature\"",
        "\"concat_hex\"", "\"first_half_hex\"", "\"second_half_hex\"", "\"blinders_count\": 2"})
  {
    auto pos = json.find(field);
    ASSERT_NE(pos, std::string::npos) << field;
    EXPECT_GT(pos, last) << field;
    last = pos;
  }

  auto sig_hex = oxenmq::to_hex(signature_response().substr(1));
  EXPECT_NE(json.find("\"concat_hex\": \"" + sig_hex + "\""), std::string::npos);
  EXPECT_NE(json.find("\"first_half_hex\": \"" + sig_hex.substr(0, 64) + "\""), std::string::npos);
  EXPECT_NE(json.find("\"second_half_hex\": \"" + sig_hex.substr(64) + "\""), std::string::npos);
  EXPECT_NE(json.find("\"device_public_key_hex\": \"" + oxenmq::to_hex(std::string(32, '\x5a')) + "\""), std::string::npos);

  a.blinders_count.reset();
  EXPECT_EQ(xelis::to_json(a).find("blinders_count"), std::string::npos);
}

TEST(attestation, write)
{
  EXPECT_EQ(xelis::attestation_path("/tmp/bundles/tx.xlb"), fs::path{"/tmp/bundles/tx.attest.json"});
  EXPECT_EQ(xelis::attestation_path("tx"), fs::path{"tx.attest.json"});

  auto dir = fs::temp_directory_path() / ("xelis-attest-" + std::to_string(::testing::UnitTest::GetInstance()->random_seed()));
  fs::create_directories(dir);
  auto file = xelis::attestation_path(dir / "signed.bin");

  auto a = xelis::build_attestation(signature_response(), test_key(), "tx"sv, path, std::nullopt, fixed_hasher, when);
  xelis::write_attestation(a, file);

  std::string contents;
  ASSERT_TRUE(tools::slurp_file(file, contents));
  EXPECT_EQ(contents, xelis::to_json(a));

  // Overwrites in place, leaving no temporary behind
  a.transaction_length = 99;
  xelis::write_attestation(a, file);
  ASSERT_TRUE(tools::slurp_file(file, contents));
  EXPECT_EQ(contents, xelis::to_json(a));
  EXPECT_EQ(std::distance(fs::directory_iterator{dir}, fs::directory_iterator{}), 1);

  EXPECT_THROW(xelis::write_attestation(a, dir / "missing" / "dir" / "x.attest.json"), xelis::attestation_error);

  fs::remove_all(dir);
}
