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

#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

#include "chunk_stream.hpp"
#include "xelis_basic/attestation.h"
#include "xelis_basic/bip32_path.h"
#include "xelis_basic/bundle.h"

namespace hw {

    namespace ledger {

        /// Blinders per send-blinders frame; frames never split a blinder
        constexpr size_t BLINDERS_PER_FRAME = 7;

        /* Minimal supported version of the XELIS device app */
        constexpr uint8_t MINIMAL_APP_VERSION_MAJOR = 0;
        constexpr uint8_t MINIMAL_APP_VERSION_MINOR = 1;
        constexpr uint8_t MINIMAL_APP_VERSION_MICRO = 0;

        struct app_version {
            uint8_t major = 0, minor = 0, micro = 0;

            bool operator<(const app_version& o) const {
                return std::tie(major, minor, micro) < std::tie(o.major, o.minor, o.micro);
            }
            std::string to_string() const;
        };

        /// Command set of the XELIS app.  Owns the transport exclusively and closes it when
        /// released or destroyed.  Not thread-safe: callers serialize access.
        class device_xelis {
        public:
            explicit device_xelis(std::unique_ptr<apdu_transport> transport, stream_options options = {});
            ~device_xelis();

            device_xelis(const device_xelis&) = delete;
            device_xelis& operator=(const device_xelis&) = delete;

            explicit operator bool() const { return (bool) m_transport; }

            const stream_options& options() const { return m_options; }

            /* ======================================================================= */
            /*                              SETUP/TEARDOWN                             */
            /* ======================================================================= */
            app_version get_app_version();
            /// Throws transport_error if the app is older than the minimal supported version
            void check_app_version();
            std::string get_app_name();

            /// Closes the transport.  Further commands throw transport_error.
            void release();

            /* ======================================================================= */
            /*                                   KEYS                                  */
            /* ======================================================================= */
            xelis::public_key get_public_key(const xelis::bip32_path& path, bool display = false);

            /* ======================================================================= */
            /*                               TRANSACTION                               */
            /* ======================================================================= */
            void load_memo(std::string_view memo);
            void send_blinders(const std::vector<xelis::blinder>& blinders);
            /// Streams the transaction after the derivation path; returns the raw signature response
            std::string sign_transaction(const xelis::bip32_path& path, std::string_view tx);

            /* ======================================================================= */
            /*                                   DEBUG                                 */
            /* ======================================================================= */
            /// Runs the on-device self tests and returns the raw report
            std::string run_debug_tests();

        private:
            apdu_transport& transport();
            apdu_response send_simple(uint8_t ins, uint8_t p1 = 0, std::string_view data = {});

            std::unique_ptr<apdu_transport> m_transport;
            stream_options m_options;
        };

    }
}
