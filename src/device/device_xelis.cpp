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

#include "device_xelis.hpp"

#include <algorithm>
#include "epee/misc_log_ex.h"

namespace hw {

    namespace ledger {

    #undef BELDEX_DEFAULT_LOG_CATEGORY
    #define BELDEX_DEFAULT_LOG_CATEGORY "device.xelis"

    std::string app_version::to_string() const {
      return std::to_string(major) + "." + std::to_string(minor) + "." + std::to_string(micro);
    }

    device_xelis::device_xelis(std::unique_ptr<apdu_transport> transport, stream_options options)
      : m_transport{std::move(transport)}, m_options{options}
    {
      CHECK_AND_ASSERT_THROW_MES(m_transport, "device_xelis needs a transport");
      MDEBUG("Device using " << m_transport->name());
    }

    device_xelis::~device_xelis() {
      try {
        release();
      } catch (const std::exception& e) {
        MERROR("Failed to close device transport: " << e.what());
      }
    }

    void device_xelis::release() {
      if (!m_transport)
        return;
      auto t = std::move(m_transport);
      MDEBUG("Releasing " << t->name());
      t->close();
    }

    apdu_transport& device_xelis::transport() {
      if (!m_transport)
        throw transport_error{"Device has been released"};
      return *m_transport;
    }

    apdu_response device_xelis::send_simple(uint8_t ins, uint8_t p1, std::string_view data) {
      apdu_command cmd;
      cmd.ins = ins;
      cmd.p1 = p1;
      cmd.data = data;
      return exchange(transport(), cmd, m_options.timeout);
    }

    /* ======================================================================= */
    /*                              SETUP/TEARDOWN                             */
    /* ======================================================================= */

    app_version device_xelis::get_app_version() {
      auto resp = send_simple(INS_GET_APP_VERSION);
      CHECK_AND_ASSERT_THROW_MES(resp.data.size() >= 3, "Invalid app version response of " << resp.data.size() << " bytes");
      return {static_cast<uint8_t>(resp.data[0]), static_cast<uint8_t>(resp.data[1]), static_cast<uint8_t>(resp.data[2])};
    }

    void device_xelis::check_app_version() {
      auto version = get_app_version();
      app_version minimal{MINIMAL_APP_VERSION_MAJOR, MINIMAL_APP_VERSION_MINOR, MINIMAL_APP_VERSION_MICRO};
      if (version < minimal)
        throw transport_error{"Unsupported device application version: " + version.to_string() +
          " At least " + minimal.to_string() + " is required."};
      MINFO("Device app version " << version.to_string());
    }

    std::string device_xelis::get_app_name() {
      return send_simple(INS_GET_APP_NAME).data;
    }

    /* ======================================================================= */
    /*                                   KEYS                                  */
    /* ======================================================================= */

    xelis::public_key device_xelis::get_public_key(const xelis::bip32_path& path, bool display) {
      auto resp = send_simple(INS_GET_PUBLIC_KEY, display ? 1 : 0, path.serialize());
      return xelis::parse_public_key_response(resp.data);
    }

    /* ======================================================================= */
    /*                               TRANSACTION                               */
    /* ======================================================================= */

    void device_xelis::load_memo(std::string_view memo) {
      MDEBUG("Loading " << memo.size() << "-byte memo");
      send_stream(transport(), INS_LOAD_MEMO, std::nullopt, memo, m_options);
    }

    void device_xelis::send_blinders(const std::vector<xelis::blinder>& blinders) {
      CHECK_AND_ASSERT_THROW_MES(!blinders.empty(), "No blinders to send");
      std::string data;
      data.reserve(blinders.size() * xelis::BLINDER_SIZE);
      for (auto& b : blinders)
        data.append(reinterpret_cast<const char*>(b.data()), b.size());

      stream_options opts = m_options;
      size_t per_frame = std::min(BLINDERS_PER_FRAME, opts.max_chunk_size / xelis::BLINDER_SIZE);
      CHECK_AND_ASSERT_THROW_MES(per_frame > 0, "Chunk size " << opts.max_chunk_size << " cannot hold a blinder");
      opts.max_chunk_size = per_frame * xelis::BLINDER_SIZE;

      MDEBUG("Sending " << blinders.size() << " blinders, " << per_frame << " per frame");
      send_stream(transport(), INS_SEND_BLINDERS, std::nullopt, data, opts);
    }

    std::string device_xelis::sign_transaction(const xelis::bip32_path& path, std::string_view tx) {
      auto path_data = path.serialize();
      MDEBUG("Signing " << tx.size() << "-byte transaction with " << path.to_string());
      return send_stream(transport(), INS_SIGN_TX, std::string_view{path_data}, tx, m_options).data;
    }

    /* ======================================================================= */
    /*                                   DEBUG                                 */
    /* ======================================================================= */

    std::string device_xelis::run_debug_tests() {
      return send_simple(INS_DEBUG_TESTS).data;
    }

    }
}
