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

#include "apdu.hpp"

#include <iomanip>
#include <sstream>
#include <utility>
#include <oxenmq/hex.h>
#include "epee/misc_log_ex.h"

namespace hw {

    namespace ledger {

    #undef BELDEX_DEFAULT_LOG_CATEGORY
    #define BELDEX_DEFAULT_LOG_CATEGORY "device.apdu"

    namespace {

    bool apdu_verbose = true;

    struct status_info {
        uint16_t code;
        std::string_view name;
        std::string_view hint;
    };

    #define XELIS_STATUS(status, hint) {status, #status##sv, hint##sv}
    constexpr status_info status_codes[] = {
      XELIS_STATUS(SW_OK, "success"),
      XELIS_STATUS(SW_DENY, "rejected by the user on the device"),
      XELIS_STATUS(SW_WRONG_P1P2, "invalid command parameters (P1/P2)"),
      XELIS_STATUS(SW_INS_NOT_SUPPORTED, "instruction not supported; is the XELIS app open?"),
      XELIS_STATUS(SW_CLA_NOT_SUPPORTED, "command class not supported; is the XELIS app open?"),
      XELIS_STATUS(SW_WRONG_LENGTH, "wrong command length"),
      XELIS_STATUS(SW_TX_DISPLAY_FAIL, "the device could not display the transaction"),
      XELIS_STATUS(SW_ADDR_DISPLAY_FAIL, "the device could not display the address"),
      XELIS_STATUS(SW_TX_WRONG_LENGTH, "transaction has the wrong length"),
      XELIS_STATUS(SW_TX_PARSING_FAIL, "the device could not parse the transaction or memo"),
      XELIS_STATUS(SW_TX_HASH_FAIL, "transaction hashing failed"),
      XELIS_STATUS(SW_TX_SIGN_FAIL, "transaction signing failed"),
      XELIS_STATUS(SW_KEY_DERIVE_FAIL, "key derivation failed; check the derivation path"),
      XELIS_STATUS(SW_VERSION_PARSING_FAIL, "unsupported transaction version"),
      XELIS_STATUS(SW_MEMO_REQUIRED, "a memo must be loaded before signing"),
      XELIS_STATUS(SW_MEMO_INVALID, "the memo was rejected by the device"),
      XELIS_STATUS(SW_INVALID_COMMITMENT, "a blinder does not open its commitment"),
      XELIS_STATUS(SW_BLINDERS_REQUIRED, "blinders must be sent before signing"),
      XELIS_STATUS(SW_INVALID_COMPRESSED_RISTRETTO, "invalid compressed point in the transaction"),
      XELIS_STATUS(SW_CRYPTO_ERROR, "cryptographic error on the device"),
      XELIS_STATUS(SW_ADDRESS_ERROR, "address error on the device"),
      XELIS_STATUS(SW_PARAM_ERROR, "invalid parameter"),
    };

    #define XELIS_INS(ins) {ins, #ins##sv}
    constexpr std::pair<uint8_t, std::string_view> ins_names[] = {
      XELIS_INS(INS_GET_APP_VERSION),
      XELIS_INS(INS_GET_APP_NAME),
      XELIS_INS(INS_GET_PUBLIC_KEY),
      XELIS_INS(INS_SIGN_TX),
      XELIS_INS(INS_LOAD_MEMO),
      XELIS_INS(INS_SEND_BLINDERS),
      XELIS_INS(INS_DEBUG_TESTS),
    };

    void log_cmd(std::string_view apdu) {
      std::ostringstream cmd;
      cmd << std::hex << std::setfill('0');
      cmd << "v=0x" << std::setw(2) << +static_cast<uint8_t>(apdu[0]);
      cmd << " i=0x" << std::setw(2) << +static_cast<uint8_t>(apdu[1]);
      if (auto name = ins_name(apdu[1]); !name.empty())
        cmd << '[' << name << ']';
      cmd << " p=(0x" << std::setw(2) << +static_cast<uint8_t>(apdu[2]) << ",0x" << std::setw(2) << +static_cast<uint8_t>(apdu[3]) << ')';
      cmd << " sz=0x" << std::setw(2) << +static_cast<uint8_t>(apdu[4]) << '[' << std::to_string(static_cast<uint8_t>(apdu[4])) << "] ";
      // Blinders are secrets: show their size only
      if (static_cast<uint8_t>(apdu[1]) == INS_SEND_BLINDERS)
        MDEBUG("CMD: " << cmd.str() << "<" << apdu.size() - APDU_HEADER_SIZE << " bytes of blinders>");
      else
        MDEBUG("CMD: " << cmd.str() << oxenmq::to_hex(apdu.substr(APDU_HEADER_SIZE)));
    }

    } // anon namespace

    std::string status_string(uint16_t sw)
    {
      for (auto& s : status_codes)
        if (s.code == sw)
          return std::string{s.name};
      if ((sw & 0xff00) == SW_WRONG_LENGTH)
        return "SW_WRONG_LENGTH(" + std::to_string(sw & 0xff) + ")";
      return "UNKNOWN"s;
    }

    std::string_view status_hint(uint16_t sw)
    {
      for (auto& s : status_codes)
        if (s.code == sw)
          return s.hint;
      if ((sw & 0xff00) == SW_WRONG_LENGTH)
        return "wrong command length"sv;
      return "unknown device error"sv;
    }

    std::string_view ins_name(uint8_t ins)
    {
      for (auto& [code, name] : ins_names)
        if (code == ins)
          return name;
      return ""sv;
    }

    void set_apdu_verbose(bool verbose) {
      apdu_verbose = verbose;
    }

    namespace {
    std::string status_message(uint16_t sw) {
      std::ostringstream msg;
      msg << "Wrong Device Status: 0x" << std::hex << std::setw(4) << std::setfill('0') << sw
          << " (" << status_string(sw) << ": " << status_hint(sw) << ")";
      return msg.str();
    }
    }

    status_error::status_error(uint16_t sw)
      : transport_error{status_message(sw)}, m_sw{sw}
    {}

    std::string apdu_command::serialize() const
    {
      CHECK_AND_ASSERT_THROW_MES(data.size() <= APDU_MAX_DATA,
          "APDU data of " << data.size() << " bytes exceeds the " << APDU_MAX_DATA << "-byte frame limit");
      std::string apdu;
      apdu.reserve(APDU_HEADER_SIZE + data.size());
      apdu += static_cast<char>(cla);
      apdu += static_cast<char>(ins);
      apdu += static_cast<char>(p1);
      apdu += static_cast<char>(p2);
      apdu += static_cast<char>(data.size());
      apdu += data;
      return apdu;
    }

    apdu_response parse_response(std::string_view raw)
    {
      if (raw.size() < 2)
        throw transport_error{"Communication error, less than two bytes received"};
      apdu_response resp;
      resp.data = raw.substr(0, raw.size() - 2);
      resp.sw = (static_cast<uint8_t>(raw[raw.size() - 2]) << 8) | static_cast<uint8_t>(raw[raw.size() - 1]);
      return resp;
    }

    apdu_response exchange(apdu_transport& transport, const apdu_command& cmd, std::chrono::milliseconds timeout)
    {
      std::string apdu = cmd.serialize();
      if (apdu_verbose)
        log_cmd(apdu);
      auto sent = std::chrono::steady_clock::now();

      auto resp = parse_response(transport.exchange(apdu, timeout));

      if (apdu_verbose)
        MDEBUG("RESP (+" << std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - sent).count() << "ms): "
              << std::hex << std::setw(4) << std::setfill('0') << resp.sw << std::dec
              << ' ' << oxenmq::to_hex(resp.data));

      if (resp.sw != SW_OK)
        throw status_error{resp.sw};
      return resp;
    }

    }
}
