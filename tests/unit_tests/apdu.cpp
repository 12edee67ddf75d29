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

#include "device/apdu.hpp"
#include "fake_transport.h"

using namespace std::literals;

TEST(apdu, serialize)
{
  hw::ledger::apdu_command cmd;
  cmd.ins = hw::ledger::INS_GET_PUBLIC_KEY;
  cmd.p1 = 1;
  cmd.data = "\x01\x02\x03"sv;
  EXPECT_EQ(cmd.serialize(), "\xe0\x05\x01\x00\x03\x01\x02\x03"s);

  hw::ledger::apdu_command empty;
  empty.ins = hw::ledger::INS_DEBUG_TESTS;
  EXPECT_EQ(empty.serialize(), "\xe0\xf0\x00\x00\x00"s);

  std::string big(256, 'x');
  hw::ledger::apdu_command too_big;
  too_big.data = big;
  EXPECT_THROW(too_big.serialize(), std::runtime_error);
  too_big.data = std::string_view{big}.substr(0, 255);
  EXPECT_EQ(too_big.serialize().size(), 260);
}

TEST(apdu, parse_response)
{
  auto r = hw::ledger::parse_response("\x20\xaa\xbb\x90\x00"sv);
  EXPECT_EQ(r.data, "\x20\xaa\xbb"s);
  EXPECT_EQ(r.sw, 0x9000);

  r = hw::ledger::parse_response("\x69\x85"sv);
  EXPECT_EQ(r.data, ""s);
  EXPECT_EQ(r.sw, hw::ledger::SW_DENY);

  EXPECT_THROW(hw::ledger::parse_response("\x90"sv), hw::ledger::transport_error);
  EXPECT_THROW(hw::ledger::parse_response(""sv), hw::ledger::transport_error);
}

TEST(apdu, status_names)
{
  EXPECT_EQ(hw::ledger::status_string(0x9000), "SW_OK");
  EXPECT_EQ(hw::ledger::status_string(0x6985), "SW_DENY");
  EXPECT_EQ(hw::ledger::status_string(0xB00C), "SW_MEMO_REQUIRED");
  EXPECT_EQ(hw::ledger::status_string(0xC001), "SW_BLINDERS_REQUIRED");
  EXPECT_EQ(hw::ledger::status_string(0x6700), "SW_WRONG_LENGTH");
  EXPECT_EQ(hw::ledger::status_string(0x6710), "SW_WRONG_LENGTH(16)");
  EXPECT_EQ(hw::ledger::status_string(0x1234), "UNKNOWN");

  EXPECT_EQ(hw::ledger::status_hint(0x6985), "rejected by the user on the device");
  EXPECT_EQ(hw::ledger::status_hint(0x1234), "unknown device error");

  EXPECT_EQ(hw::ledger::ins_name(hw::ledger::INS_SIGN_TX), "INS_SIGN_TX");
  EXPECT_EQ(hw::ledger::ins_name(0x42), "");
}

TEST(apdu, exchange)
{
  test::fake_transport t;
  auto log = t.history();
  log->script.push_back(test::with_sw("\x01\x02"s));
  log->script.push_back(test::with_sw("", hw::ledger::SW_DENY));
  log->script.push_back(std::nullopt);

  hw::ledger::apdu_command cmd;
  cmd.ins = hw::ledger::INS_GET_APP_VERSION;
  auto r = hw::ledger::exchange(t, cmd, 1234ms);
  EXPECT_EQ(r.data, "\x01\x02"s);
  EXPECT_EQ(r.sw, hw::ledger::SW_OK);
  ASSERT_EQ(log->sent.size(), 1);
  EXPECT_EQ(log->sent[0], "\xe0\x03\x00\x00\x00"s);
  EXPECT_EQ(log->timeouts[0], 1234ms);

  try {
    hw::ledger::exchange(t, cmd);
    FAIL() << "expected status_error";
  } catch (const hw::ledger::status_error& e) {
    EXPECT_EQ(e.sw(), hw::ledger::SW_DENY);
    EXPECT_NE(std::string{e.what()}.find("SW_DENY"), std::string::npos);
  }
  EXPECT_EQ(log->timeouts[1], hw::ledger::DEFAULT_EXCHANGE_TIMEOUT);

  EXPECT_THROW(hw::ledger::exchange(t, cmd), hw::ledger::transport_error);

  // Logging off must not change the exchange
  hw::ledger::set_apdu_verbose(false);
  EXPECT_EQ(hw::ledger::exchange(t, cmd).sw, hw::ledger::SW_OK);
  hw::ledger::set_apdu_verbose(true);
}
