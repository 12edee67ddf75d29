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

#include "chunk_stream.hpp"

#include "epee/misc_log_ex.h"

namespace hw {

    namespace ledger {

    #undef BELDEX_DEFAULT_LOG_CATEGORY
    #define BELDEX_DEFAULT_LOG_CATEGORY "device.stream"

    uint8_t chunk::sequence() const {
      return sequence_byte(index);
    }

    std::vector<chunk> plan_stream(std::optional<std::string_view> prefix, std::string_view payload, size_t max_chunk_size)
    {
      CHECK_AND_ASSERT_THROW_MES(max_chunk_size >= 1 && max_chunk_size <= APDU_MAX_DATA,
          "Invalid chunk size " << max_chunk_size << ", must be between 1 and " << APDU_MAX_DATA);
      CHECK_AND_ASSERT_THROW_MES(!prefix || prefix->size() <= APDU_MAX_DATA,
          "Stream prefix of " << prefix->size() << " bytes does not fit in one frame");

      std::vector<chunk> chunks;
      chunks.reserve((prefix ? 1 : 0) + payload.size() / max_chunk_size + 1);
      if (prefix)
        chunks.push_back({0, *prefix, true, false});

      do {
        auto piece = payload.substr(0, max_chunk_size);
        payload.remove_prefix(piece.size());
        size_t index = chunks.size();
        chunks.push_back({index, piece, index == 0, payload.empty()});
      } while (!payload.empty());

      return chunks;
    }

    apdu_response send_stream(apdu_transport& transport, uint8_t ins, std::optional<std::string_view> prefix,
        std::string_view payload, const stream_options& options)
    {
      auto chunks = plan_stream(prefix, payload, options.max_chunk_size);
      MDEBUG("Streaming " << payload.size() << " bytes" << (prefix ? " plus a " + std::to_string(prefix->size()) + "-byte prefix" : ""s)
          << " to " << ins_name(ins) << " in " << chunks.size() << " chunks");

      apdu_response last;
      for (auto& c : chunks) {
        apdu_command cmd;
        cmd.ins = ins;
        cmd.p1 = c.sequence();
        cmd.p2 = c.flag();
        cmd.data = c.payload;
        try {
          last = exchange(transport, cmd, options.timeout);
        } catch (const transport_error& e) {
          MERROR("Stream to " << ins_name(ins) << " aborted at chunk " << c.index + 1 << "/" << chunks.size() << ": " << e.what());
          throw;
        }
      }
      return last;
    }

    }
}
