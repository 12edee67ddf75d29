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

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "transport.hpp"

namespace hw {

    namespace ledger {

        constexpr uint8_t CLA_XELIS = 0xE0;

        /* Instruction codes of the XELIS app */
        constexpr uint8_t INS_GET_APP_VERSION = 0x03;
        constexpr uint8_t INS_GET_APP_NAME = 0x04;
        constexpr uint8_t INS_GET_PUBLIC_KEY = 0x05;
        constexpr uint8_t INS_SIGN_TX = 0x06;
        constexpr uint8_t INS_LOAD_MEMO = 0x10;
        constexpr uint8_t INS_SEND_BLINDERS = 0x12;
        constexpr uint8_t INS_DEBUG_TESTS = 0xF0;

        /* Stream continuation flag (P2) */
        constexpr uint8_t P2_MORE = 0x80;
        constexpr uint8_t P2_LAST = 0x00;

        constexpr size_t APDU_HEADER_SIZE = 5;
        constexpr size_t APDU_MAX_DATA = 255;

        /* Status words */
        constexpr uint16_t SW_OK = 0x9000;
        constexpr uint16_t SW_DENY = 0x6985;
        constexpr uint16_t SW_WRONG_P1P2 = 0x6A86;
        constexpr uint16_t SW_INS_NOT_SUPPORTED = 0x6D00;
        constexpr uint16_t SW_CLA_NOT_SUPPORTED = 0x6E00;
        constexpr uint16_t SW_WRONG_LENGTH = 0x6700;
        constexpr uint16_t SW_TX_DISPLAY_FAIL = 0xB001;
        constexpr uint16_t SW_ADDR_DISPLAY_FAIL = 0xB002;
        constexpr uint16_t SW_TX_WRONG_LENGTH = 0xB004;
        constexpr uint16_t SW_TX_PARSING_FAIL = 0xB005;
        constexpr uint16_t SW_TX_HASH_FAIL = 0xB006;
        constexpr uint16_t SW_TX_SIGN_FAIL = 0xB008;
        constexpr uint16_t SW_KEY_DERIVE_FAIL = 0xB009;
        constexpr uint16_t SW_VERSION_PARSING_FAIL = 0xB00A;
        constexpr uint16_t SW_MEMO_REQUIRED = 0xB00C;
        constexpr uint16_t SW_MEMO_INVALID = 0xB00D;
        constexpr uint16_t SW_INVALID_COMMITMENT = 0xC000;
        constexpr uint16_t SW_BLINDERS_REQUIRED = 0xC001;
        constexpr uint16_t SW_INVALID_COMPRESSED_RISTRETTO = 0xC002;
        constexpr uint16_t SW_CRYPTO_ERROR = 0x6F00;
        constexpr uint16_t SW_ADDRESS_ERROR = 0x6F01;
        constexpr uint16_t SW_PARAM_ERROR = 0x6F02;

        /// Symbolic name of a status word, e.g. "SW_DENY"
        std::string status_string(uint16_t sw);
        /// Human readable cause of a status word, for error messages
        std::string_view status_hint(uint16_t sw);
        /// Symbolic name of an instruction code
        std::string_view ins_name(uint8_t ins);

        /// Enables or disables debug logging of every command and response
        void set_apdu_verbose(bool verbose);

        /// The device answered with something other than SW_OK
        class status_error : public transport_error {
        public:
            explicit status_error(uint16_t sw);
            uint16_t sw() const { return m_sw; }
        private:
            uint16_t m_sw;
        };

        struct apdu_command {
            uint8_t cla = CLA_XELIS;
            uint8_t ins = 0;
            uint8_t p1 = 0;
            uint8_t p2 = 0;
            std::string_view data;

            /// `cla | ins | p1 | p2 | len | data`; throws if data exceeds APDU_MAX_DATA
            std::string serialize() const;
        };

        struct apdu_response {
            std::string data;
            uint16_t sw = 0;
        };

        /// Splits a raw response into payload and status word.  Throws transport_error if fewer
        /// than two bytes were received.
        apdu_response parse_response(std::string_view raw);

        /// Sends one command and waits for its response.  Any status word other than SW_OK throws
        /// status_error.
        apdu_response exchange(apdu_transport& transport, const apdu_command& cmd,
                std::chrono::milliseconds timeout = DEFAULT_EXCHANGE_TIMEOUT);

    }
}
