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

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace hw {

    namespace ledger {

        /// Report kind of the device self-test suite
        constexpr uint8_t REPORT_KIND_SELF_TEST = 0x2C;

        /* Section and case markers of the self-test report */
        namespace report_marker {
            constexpr uint8_t derivation = 0xBD;
            constexpr uint8_t derivation_case = 0xD4;
            constexpr uint8_t derivation_end = 0xDD;
            constexpr uint8_t key_matrix = 0xF6;
            constexpr uint8_t key_case_first = 0xA1;
            constexpr uint8_t key_case_last = 0xA4;
            constexpr uint8_t key_matrix_end = 0xAA;
            constexpr uint8_t address_matrix = 0xAD;
            constexpr uint8_t address_case_first = 0xB1;
            constexpr uint8_t address_case_last = 0xB4;
            constexpr uint8_t address_matrix_end = 0xAF;
        }

        /* Address result bytes; anything else is a mismatch carrying debug bytes */
        constexpr uint8_t ADDRESS_RESULT_PASS = 0x01;
        constexpr uint8_t ADDRESS_RESULT_FAIL = 0xFF;
        constexpr size_t ADDRESS_EXCERPT_MAX = 8;
        /// Size of the key excerpts in the derivation debug section
        constexpr size_t DERIVATION_EXCERPT_SIZE = 8;

        enum class test_outcome { pass, fail, mismatch };

        std::string_view to_string(test_outcome o);

        /// BIP32 derivation followed by clamping and public key computation on the device
        struct derivation_case {
            bool derived = false;
            std::string raw_key;       // leading bytes of the derived key
            std::optional<uint8_t> reduce_marker;
            std::string clamped_key;   // leading bytes of the clamped scalar
            std::optional<bool> public_key_derived;
            std::string public_key;    // leading bytes of the public key
            bool truncated = false;
        };

        struct derivation_debug {
            std::optional<derivation_case> test;
            /// Bytes between the case and the terminator that the layout does not describe
            std::string unannotated;
            bool terminated = false;
        };

        struct key_case {
            uint8_t marker;
            bool derived = false;
            std::optional<bool> matches;

            test_outcome outcome() const;
        };

        struct key_matrix {
            std::vector<key_case> cases;
            std::string unannotated;
            bool terminated = false;
        };

        struct address_result {
            uint8_t result;
            /// Debug bytes, present on a mismatch
            std::optional<uint8_t> actual_len;
            std::optional<uint8_t> expected_len;
            std::string excerpt;
            bool truncated = false;

            test_outcome outcome() const;
        };

        struct address_case {
            uint8_t marker;
            std::optional<address_result> mainnet;
            std::optional<address_result> testnet;
        };

        struct address_matrix {
            std::vector<address_case> cases;
            std::string unannotated;
            bool terminated = false;
        };

        /// Bytes from `offset` on that no section decoder recognized
        struct unparsed_tail {
            size_t offset;
            std::string bytes;
        };

        using report_section = std::variant<derivation_debug, key_matrix, address_matrix, unparsed_tail>;

        struct debug_report {
            std::optional<uint8_t> kind;
            std::vector<report_section> sections;
            /// Problems noticed while decoding: unknown kind, missing terminators, cut-off records
            std::vector<std::string> annotations;

            bool known_kind() const { return kind == REPORT_KIND_SELF_TEST; }
            /// True if every decoded case passed and nothing was left undecoded
            bool all_passed() const;
        };

        /// Expected results of the self-test identities, keyed by the case markers the device
        /// emits.  Owned by the caller; the decoder only identifies cases by marker.
        struct report_fixture {
            struct identity {
                uint8_t key_marker;
                uint8_t address_marker;
                std::string name;
                std::string expected_public_key_hex;
                std::string expected_mainnet_address;
                std::string expected_testnet_address;
            };
            std::vector<identity> identities;

            const identity* by_key_marker(uint8_t marker) const;
            const identity* by_address_marker(uint8_t marker) const;
        };

        /// Decodes a debug-test response.  Never throws on malformed content: unknown kinds and
        /// markers end up as unparsed tails, and gaps are recorded as annotations.
        debug_report decode_report(std::string_view response);

        /// Multi-line human readable rendering of a decoded report
        std::string format_report(const debug_report& report, const report_fixture& fixture);

    }
}
