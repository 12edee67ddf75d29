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
#include <stdexcept>
#include <string>
#include <string_view>

namespace hw {

    namespace ledger {

        using namespace std::literals;

        /// Default bound on a single command/response exchange
        constexpr std::chrono::milliseconds DEFAULT_EXCHANGE_TIMEOUT = 60s;

        /// Raised when the transport cannot deliver a command or the device does not answer in time
        class transport_error : public std::runtime_error {
        public:
            using std::runtime_error::runtime_error;
        };

        /// Byte-level link to a device.  Implementations (USB HID, TCP to an emulator, ...) live
        /// outside this library; everything above this class only sees raw APDUs.
        class apdu_transport {
        public:
            apdu_transport() = default;
            virtual ~apdu_transport() = default;

            apdu_transport(const apdu_transport&) = delete;
            apdu_transport& operator=(const apdu_transport&) = delete;

            /// Sends one serialized APDU and blocks until the device answers or `timeout` elapses.
            /// Returns the raw response (payload followed by the two status word bytes).  Throws
            /// transport_error on failure or timeout.
            virtual std::string exchange(std::string_view apdu, std::chrono::milliseconds timeout) = 0;

            /// Releases the underlying connection.  Must be safe to call more than once.
            virtual void close() = 0;

            virtual std::string name() const { return "transport"; }
        };

    }
}
