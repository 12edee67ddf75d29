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

#include <algorithm>
#include <cctype>
#include <iostream>
#include <optional>
#include <oxenmq/hex.h>
#include "common/command_line.h"
#include "common/file.h"
#include "common/hex.h"
#include "common/sha3sum.h"
#include "crypto/hash.h"
#include "device/chunk_stream.hpp"
#include "device/debug_report.hpp"
#include "device/device_xelis.hpp"
#include "xelis_basic/attestation.h"
#include "xelis_basic/bip32_path.h"
#include "xelis_basic/bundle.h"
#include "xelis_basic/memo.h"
#include "version.h"
#include "epee/misc_log_ex.h"

#undef BELDEX_DEFAULT_LOG_CATEGORY
#define BELDEX_DEFAULT_LOG_CATEGORY "debugtools.xelis_ledger_sign"

namespace po = boost::program_options;

namespace {

const command_line::arg_descriptor<std::string> arg_command = {"command", "inspect | decode-report | attest", ""};
const command_line::arg_descriptor<std::string> arg_input = {"input", "Bundle, transaction or report file", ""};
const command_line::arg_descriptor<std::string> arg_signature_response = {"signature-response",
  "Hex of the 65-byte signature response returned by the device", ""};
const command_line::arg_descriptor<std::string> arg_public_key = {"public-key",
  "Hex of the device public key (32 bytes) or of the whole get-public-key response (33 bytes)", ""};
const command_line::arg_descriptor<std::string> arg_bip32_path = {"bip32-path", "Derivation path used for signing",
  std::string{xelis::DEFAULT_BIP32_PATH}};
const command_line::arg_descriptor<std::string> arg_output = {"output",
  "Attestation file; defaults to <input without extension>.attest.json", ""};
const command_line::arg_descriptor<size_t> arg_chunk_size = {"chunk-size", "Maximum APDU payload per frame",
  hw::ledger::DEFAULT_CHUNK_SIZE};

// Expected results of the device self tests, by case marker
const hw::ledger::report_fixture& self_test_fixture()
{
  static const hw::ledger::report_fixture fixture{{
    {0xA1, 0xB1, "Private key = 1",
      "8c9240b456a9e6dc65c377a1048d745f94a08cdb7f44cbcd7b46f34048871134",
      "xel:3jfypdzk48ndcewrw7ssfrt5t722prxm0azvhntmgme5qjy8zy6qqckgjqg",
      "xet:3jfypdzk48ndcewrw7ssfrt5t722prxm0azvhntmgme5qjy8zy6qqq9zzvk"},
    {0xA2, 0xB2, "Private key = 2",
      "f05bc1df2831717c2992d85b57e0cf3d123fd6c254257de5f784be369747b249",
      "xel:7pdurhegx9chc2vjmpd40cx085frl4kz2sjhme0hsjlrd968kfysq434xga",
      "xet:7pdurhegx9chc2vjmpd40cx085frl4kz2sjhme0hsjlrd968kfysqdzlkyr"},
    {0xA3, 0xB3, "Private key = [0x01; 32]",
      "02064b89dc89f5c353cf2077800e24fb83300d48b1af4a3926f1fe0a1864cf06",
      "xel:qgryhzwu386ux570ypmcqr3ylwpnqr2gkxh55wfx78lq5xryeurqqza63mr",
      "xet:qgryhzwu386ux570ypmcqr3ylwpnqr2gkxh55wfx78lq5xryeurqq6wspha"},
    {0xA4, 0xB4, "Private key = [0xff; 32]",
      "f6decfbf9efabc8aa59452aa570cb84eed7fcfca7daea58a93b93444400a7a73",
      "xel:7m0vl0u7l27g4fv52249wr9cfmkhln720kh2tz5nhy6ygsq20fesqn2udfx",
      "xet:7m0vl0u7l27g4fv52249wr9cfmkhln720kh2tz5nhy6ygsq20fesqteka9c"},
  }};
  return fixture;
}

std::string read_input(const po::variables_map& vm)
{
  auto input = command_line::get_required_arg(vm, arg_input);
  std::string data;
  if (!tools::slurp_file(input, data))
    throw std::runtime_error{"Failed to read " + input};
  return data;
}

// Accepts a hex dump (whitespace ignored) and falls back to the raw bytes otherwise
std::string hex_or_binary(std::string_view data)
{
  std::string hex;
  for (char c : data)
    if (!std::isspace(static_cast<unsigned char>(c)))
      hex += c;
  if (!hex.empty() && oxenmq::is_hex(hex))
    return oxenmq::from_hex(hex);
  return std::string{data};
}

size_t frame_count(std::optional<std::string_view> prefix, std::string_view payload, size_t chunk_size)
{
  return hw::ledger::plan_stream(prefix, payload, chunk_size).size();
}

int inspect(const po::variables_map& vm)
{
  auto data = read_input(vm);
  auto loaded = xelis::load_bundle_or_raw(data);
  auto& b = loaded.contents;
  auto path = xelis::bip32_path::parse(command_line::get_arg(vm, arg_bip32_path));
  size_t chunk_size = command_line::get_arg(vm, arg_chunk_size);

  if (loaded.was_bundle)
    std::cout << "Bundle version " << +b.version << "\n";
  else
    std::cout << "Bare transaction (no " << xelis::BUNDLE_MAGIC << " signature)\n";

  std::cout << "Memo: " << b.memo.size() << " bytes\n";
  if (!b.memo.empty())
  {
    try {
      std::cout << xelis::format_memo_preview(xelis::parse_memo_preview(b.memo));
    } catch (const xelis::memo_error& e) {
      std::cout << "  (cannot preview: " << e.what() << ")\n";
    }
  }
  std::cout << "Blinders: " << b.blinders.size() << "\n";
  std::cout << "Transaction: " << b.transaction.size() << " bytes\n";
  std::cout << "SHA3-512: " << tools::type_to_hex(tools::sha3_512(b.transaction)) << "\n";

  std::cout << "APDU frames at " << chunk_size << " bytes per frame:\n";
  if (!b.memo.empty())
    std::cout << "  load memo: " << frame_count(std::nullopt, b.memo, chunk_size) << "\n";
  if (!b.blinders.empty())
  {
    size_t per_frame = std::min(hw::ledger::BLINDERS_PER_FRAME, chunk_size / xelis::BLINDER_SIZE);
    if (per_frame == 0)
      std::cout << "  send blinders: chunk size too small for a blinder\n";
    else
      std::cout << "  send blinders: " << (b.blinders.size() + per_frame - 1) / per_frame << "\n";
  }
  auto path_data = path.serialize();
  std::cout << "  sign transaction (" << path.to_string() << "): "
    << frame_count(std::string_view{path_data}, b.transaction, chunk_size) << "\n";
  return 0;
}

int decode_report(const po::variables_map& vm)
{
  auto report = hw::ledger::decode_report(hex_or_binary(read_input(vm)));
  std::cout << hw::ledger::format_report(report, self_test_fixture());
  return 0;
}

int attest(const po::variables_map& vm)
{
  fs::path input = command_line::get_arg(vm, arg_input);
  auto loaded = xelis::load_bundle_or_raw(read_input(vm));
  auto signature_response = command_line::get_hex_arg(vm, arg_signature_response, {xelis::SIGNATURE_RESPONSE_SIZE});
  auto key_bytes = command_line::get_hex_arg(vm, arg_public_key, {xelis::PUBLIC_KEY_SIZE, 1 + xelis::PUBLIC_KEY_SIZE});
  auto path = xelis::bip32_path::parse(command_line::get_arg(vm, arg_bip32_path));

  xelis::public_key key;
  if (key_bytes.size() == key.size())
    std::copy(key_bytes.begin(), key_bytes.end(), key.begin());
  else
    key = xelis::parse_public_key_response(key_bytes);

  std::optional<uint64_t> blinder_count;
  if (!loaded.contents.blinders.empty())
    blinder_count = loaded.contents.blinders.size();

  auto record = xelis::build_attestation(signature_response, key, loaded.contents.transaction, path, blinder_count, tools::sha3_512);

  fs::path output = command_line::get_arg(vm, arg_output);
  if (output.empty())
    output = xelis::attestation_path(input);
  xelis::write_attestation(record, output);
  std::cout << xelis::to_json(record);
  return 0;
}

}

int main(int argc, char* argv[])
{
  po::options_description desc_cmd_only("Command line options");
  po::options_description desc_cmd_sett("Command line options and settings options");

  command_line::add_arg(desc_cmd_sett, command_line::arg_log_level);
  command_line::add_arg(desc_cmd_sett, command_line::arg_log_file);
  command_line::add_arg(desc_cmd_sett, arg_command);
  command_line::add_arg(desc_cmd_sett, arg_input);
  command_line::add_arg(desc_cmd_sett, arg_signature_response);
  command_line::add_arg(desc_cmd_sett, arg_public_key);
  command_line::add_arg(desc_cmd_sett, arg_bip32_path);
  command_line::add_arg(desc_cmd_sett, arg_output);
  command_line::add_arg(desc_cmd_sett, arg_chunk_size);

  command_line::add_arg(desc_cmd_only, command_line::arg_help);
  command_line::add_arg(desc_cmd_only, command_line::arg_version);

  po::options_description desc_options("Allowed options");
  desc_options.add(desc_cmd_only).add(desc_cmd_sett);

  po::variables_map vm;
  bool r = command_line::handle_error_helper(desc_options, [&]()
  {
    po::store(po::parse_command_line(argc, argv, desc_options), vm);
    po::notify(vm);
    return true;
  });
  if (! r)
    return 1;

  if (command_line::get_arg(vm, command_line::arg_help))
  {
    std::cout << "XELIS Ledger sign '" << XELIS_SIGN_RELEASE_NAME << "' (v" << XELIS_SIGN_VERSION_FULL << ")\n\n";
    std::cout << desc_options << std::endl;
    return 1;
  }
  if (command_line::get_arg(vm, command_line::arg_version))
  {
    std::cout << "XELIS Ledger sign '" << XELIS_SIGN_RELEASE_NAME << "' (v" << XELIS_SIGN_VERSION_FULL << ")" << std::endl;
    return 0;
  }

  command_line::configure_logging(vm);

  auto command = command_line::get_arg(vm, arg_command);
  try
  {
    if (command == "inspect")
      return inspect(vm);
    if (command == "decode-report")
      return decode_report(vm);
    if (command == "attest")
      return attest(vm);
  }
  catch (const std::exception& e)
  {
    MERROR(command << " failed: " << e.what());
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << "Usage: --command <inspect|decode-report|attest> --input <file>" << std::endl;
  return 1;
}
