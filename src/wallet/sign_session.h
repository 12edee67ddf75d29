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
#include <optional>
#include <string>
#include <string_view>

#include "common/file.h"
#include "common/sha3sum.h"
#include "device/device_xelis.hpp"
#include "xelis_basic/attestation.h"
#include "xelis_basic/bip32_path.h"

namespace xelis
{
  struct sign_options
  {
    bip32_path path = bip32_path::parse(DEFAULT_BIP32_PATH);
    /// Where to write the attestation; nothing is written if unset
    std::optional<fs::path> output;
    message_hasher hasher = tools::sha3_512;
  };

  struct sign_result
  {
    bool was_bundle;
    std::string signature_response;
    attestation record;
  };

  /*! \brief Signs a bundle (or bare transaction) on `device`.
   *
   *  Frames are sized and timed by the device's own stream_options.
   *
   *  Sends the memo if there is one, then the blinders if there are any, then streams the
   *  transaction after the derivation path, fetches the signing key and builds the attestation.
   *  Any failure aborts the whole attempt; a new attempt starts again from the memo.
   *
   *  \throws bundle_error, hw::ledger::transport_error, attestation_error
   */
  sign_result sign_bundle(hw::ledger::device_xelis& device, std::string_view input, const sign_options& options);

  /// Reads `input`, signs it over `transport` (framed with `stream`) and writes
  /// `<input>.attest.json` (or `options.output`).  The transport is closed before returning, whether
  /// signing succeeded or not.
  sign_result sign_bundle_file(std::unique_ptr<hw::ledger::apdu_transport> transport, const fs::path& input,
      sign_options options, const hw::ledger::stream_options& stream = {});
}
