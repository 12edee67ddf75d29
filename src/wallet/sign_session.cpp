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

#include "sign_session.h"

#include "common/hex.h"
#include "xelis_basic/bundle.h"
#include "xelis_basic/memo.h"
#include "epee/misc_log_ex.h"

#undef BELDEX_DEFAULT_LOG_CATEGORY
#define BELDEX_DEFAULT_LOG_CATEGORY "xelis.sign"

using namespace std::literals;

namespace xelis
{
  sign_result sign_bundle(hw::ledger::device_xelis& device, std::string_view input, const sign_options& options)
  {
    auto loaded = load_bundle_or_raw(input);
    const bundle& b = loaded.contents;
    MINFO((loaded.was_bundle ? "Signing bundle v" + std::to_string(b.version) : "Signing bare transaction"s)
        << ": memo " << b.memo.size() << " bytes, " << b.blinders.size() << " blinders, transaction "
        << b.transaction.size() << " bytes");

    if (!b.memo.empty())
    {
      try {
        MDEBUG("Memo preview:\n" << format_memo_preview(parse_memo_preview(b.memo)));
      } catch (const memo_error& e) {
        MWARNING("Memo cannot be previewed, sending it as-is: " << e.what());
      }
      device.load_memo(b.memo);
    }

    if (!b.blinders.empty())
      device.send_blinders(b.blinders);

    sign_result result;
    result.was_bundle = loaded.was_bundle;
    result.signature_response = device.sign_transaction(options.path, b.transaction);
    MDEBUG("Signature response: " << tools::abbreviated_hex(result.signature_response, 65));

    auto key = device.get_public_key(options.path);
    std::optional<uint64_t> blinder_count;
    if (!b.blinders.empty())
      blinder_count = b.blinders.size();
    result.record = build_attestation(result.signature_response, key, b.transaction, options.path, blinder_count, options.hasher);

    if (options.output)
      write_attestation(result.record, *options.output);
    return result;
  }

  sign_result sign_bundle_file(std::unique_ptr<hw::ledger::apdu_transport> transport, const fs::path& input,
      sign_options options, const hw::ledger::stream_options& stream)
  {
    hw::ledger::device_xelis device{std::move(transport), stream};

    std::string data;
    if (!tools::slurp_file(input, data))
      throw std::runtime_error{"Failed to read " + input.string()};
    if (!options.output)
      options.output = attestation_path(input);

    return sign_bundle(device, data, options);
  }
}
