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

#include "attestation.h"

#include <cstring>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include "common/hex.h"
#include "epee/misc_log_ex.h"

#undef BELDEX_DEFAULT_LOG_CATEGORY
#define BELDEX_DEFAULT_LOG_CATEGORY "xelis.attestation"

namespace xelis
{
  public_key parse_public_key_response(std::string_view response)
  {
    if (response.size() != 1 + PUBLIC_KEY_SIZE || static_cast<uint8_t>(response[0]) != PUBLIC_KEY_SIZE)
      throw attestation_error{"Malformed public key response: expected " + std::to_string(1 + PUBLIC_KEY_SIZE) +
        " bytes starting with " + std::to_string(PUBLIC_KEY_SIZE) + ", got " + std::to_string(response.size()) +
        " bytes: " + tools::abbreviated_hex(response)};
    public_key key;
    std::memcpy(key.data(), response.data() + 1, key.size());
    return key;
  }

  attestation build_attestation(
      std::string_view signature_response,
      const public_key& key,
      std::string_view message,
      const bip32_path& path,
      std::optional<uint64_t> blinder_count,
      const message_hasher& hasher,
      std::chrono::system_clock::time_point when)
  {
    if (signature_response.size() != SIGNATURE_RESPONSE_SIZE)
      throw attestation_error{"Malformed signature: expected a " + std::to_string(SIGNATURE_RESPONSE_SIZE) +
        "-byte response, got " + std::to_string(signature_response.size()) + " bytes"};
    if (static_cast<uint8_t>(signature_response[0]) != SIGNATURE_SIZE)
      throw attestation_error{"Malformed signature: length prefix is " +
        std::to_string(static_cast<uint8_t>(signature_response[0])) + ", expected " + std::to_string(SIGNATURE_SIZE)};
    CHECK_AND_ASSERT_THROW_MES(hasher, "No message digest function given");

    attestation a;
    a.timestamp = std::chrono::duration_cast<std::chrono::seconds>(when.time_since_epoch()).count();
    a.bip32_path = path.to_string();
    a.device_public_key = key;
    a.transaction_length = message.size();
    a.message_digest = hasher(message);
    auto sig = signature_response.substr(1);
    std::memcpy(a.signature_first_half.data(), sig.data(), a.signature_first_half.size());
    std::memcpy(a.signature_second_half.data(), sig.data() + a.signature_first_half.size(), a.signature_second_half.size());
    a.blinders_count = blinder_count;

    MINFO("Built attestation for " << a.transaction_length << "-byte transaction, digest " << a.message_digest);
    return a;
  }

  std::string to_json(const attestation& a)
  {
    rapidjson::Document json;
    json.SetObject();
    auto& alloc = json.GetAllocator();

    rapidjson::Value value(rapidjson::kStringType);
    rapidjson::Value value2(rapidjson::kNumberType);

    value2.SetUint(a.version);
    json.AddMember("version", value2, alloc);

    value2.SetUint64(a.timestamp);
    json.AddMember("timestamp", value2, alloc);

    value.SetString(a.bip32_path.c_str(), a.bip32_path.size(), alloc);
    json.AddMember("bip32_path", value, alloc);

    std::string key_hex = tools::type_to_hex(a.device_public_key);
    value.SetString(key_hex.c_str(), key_hex.size(), alloc);
    json.AddMember("device_public_key_hex", value, alloc);

    value2.SetUint64(a.transaction_length);
    json.AddMember("transaction_length", value2, alloc);

    std::string digest_hex = tools::type_to_hex(a.message_digest);
    value.SetString(digest_hex.c_str(), digest_hex.size(), alloc);
    json.AddMember("message_digest_hex", value, alloc);

    std::string first = tools::type_to_hex(a.signature_first_half);
    std::string second = tools::type_to_hex(a.signature_second_half);
    std::string concat = first + second;
    rapidjson::Value signature(rapidjson::kObjectType);
    value.SetString(concat.c_str(), concat.size(), alloc);
    signature.AddMember("concat_hex", value, alloc);
    value.SetString(first.c_str(), first.size(), alloc);
    signature.AddMember("first_half_hex", value, alloc);
    value.SetString(second.c_str(), second.size(), alloc);
    signature.AddMember("second_half_hex", value, alloc);
    json.AddMember("signature", signature, alloc);

    if (a.blinders_count)
    {
      value2.SetUint64(*a.blinders_count);
      json.AddMember("blinders_count", value2, alloc);
    }

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    json.Accept(writer);
    return std::string{buffer.GetString(), buffer.GetSize()} + "\n";
  }

  fs::path attestation_path(const fs::path& input)
  {
    fs::path out = input;
    out.replace_extension(".attest.json");
    return out;
  }

  void write_attestation(const attestation& a, const fs::path& filename)
  {
    std::string contents = to_json(a);
    if (!tools::dump_file_atomic(filename, contents))
      throw attestation_error{"Failed to write attestation to " + filename.string()};
    MGINFO("Attestation written to " << filename.string());
  }
}
