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
#include <optional>
#include <string_view>
#include <vector>

#include "apdu.hpp"

namespace hw {

    namespace ledger {

        /// Frame size used when nothing else is configured
        constexpr size_t DEFAULT_CHUNK_SIZE = 250;

        struct stream_options {
            size_t max_chunk_size = DEFAULT_CHUNK_SIZE;
            std::chrono::milliseconds timeout = DEFAULT_EXCHANGE_TIMEOUT;
        };

        /// One frame of a streamed payload.  `payload` points into the caller's buffers.
        struct chunk {
            size_t index;
            std::string_view payload;
            bool is_first;
            bool is_last;

            /// P1 byte of this chunk: 0 for the first chunk, then 1..255 wrapping back to 1
            uint8_t sequence() const;
            /// P2 byte of this chunk
            uint8_t flag() const { return is_last ? P2_LAST : P2_MORE; }
        };

        /// Sequence byte of the chunk at position `index` of a stream
        constexpr uint8_t sequence_byte(size_t index) {
            return index == 0 ? 0 : static_cast<uint8_t>((index - 1) % 255 + 1);
        }

        /*! \brief Splits a stream into frames without sending anything.
         *
         *  If `prefix` is given it becomes chunk 0 on its own and is never the last chunk.  The
         *  payload follows in slices of at most `max_chunk_size` bytes; exactly one chunk, the one
         *  ending at the payload's last byte, is flagged last.  An empty payload still yields one
         *  empty last chunk.
         *
         *  Throws if `max_chunk_size` is not within [1, APDU_MAX_DATA] or the prefix does not fit
         *  in one frame.
         */
        std::vector<chunk> plan_stream(std::optional<std::string_view> prefix, std::string_view payload, size_t max_chunk_size);

        /// Sends `payload` (preceded by `prefix`, if given) as a sequence of `ins` commands, one
        /// exchange at a time.  Stops at the first failing exchange and rethrows its error; nothing
        /// is retried.  Returns the response to the last chunk.
        apdu_response send_stream(apdu_transport& transport, uint8_t ins, std::optional<std::string_view> prefix,
                std::string_view payload, const stream_options& options = {});

    }
}
