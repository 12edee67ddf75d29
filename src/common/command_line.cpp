// Copyright (c) 2024, The XELIS Ledger Sign Project
// Copyright (c) 2014-2019, The Monero Project
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
// 
// Parts of this file are originally copyright (c) 2012-2013 The Cryptonote developers

#include "command_line.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string_view>
#include <oxenmq/hex.h>

namespace command_line
{
const arg_descriptor<bool> arg_help = {"help", "Produce help message", false};
const arg_descriptor<bool> arg_version = {"version", "Output version information", false};
const arg_descriptor<std::string> arg_log_level = {"log-level", "0-4 or categories, e.g. \"device.apdu:DEBUG\"", ""};
const arg_descriptor<std::string> arg_log_file = {"log-file", "Write log output to this file as well as the console", ""};

std::string get_required_arg(const boost::program_options::variables_map& vm, const arg_descriptor<std::string>& arg)
{
  auto value = get_arg(vm, arg);
  if (value.empty())
    throw std::runtime_error{"--" + std::string{arg.name} + " is required"};
  return value;
}

std::string get_hex_arg(const boost::program_options::variables_map& vm, const arg_descriptor<std::string>& arg,
    std::initializer_list<size_t> sizes)
{
  auto value = get_required_arg(vm, arg);
  std::string_view hex{value};
  while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.front())))
    hex.remove_prefix(1);
  while (!hex.empty() && std::isspace(static_cast<unsigned char>(hex.back())))
    hex.remove_suffix(1);
  if (hex.size() >= 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
    hex.remove_prefix(2);

  if (hex.empty() || !oxenmq::is_hex(hex))
    throw std::runtime_error{"--" + std::string{arg.name} + " is not valid hex"};
  auto bytes = oxenmq::from_hex(hex);
  if (sizes.size() && std::find(sizes.begin(), sizes.end(), bytes.size()) == sizes.end())
    throw std::runtime_error{"--" + std::string{arg.name} + " has unexpected length " + std::to_string(bytes.size()) + " bytes"};
  return bytes;
}

void configure_logging(const boost::program_options::variables_map& vm)
{
  mlog_configure(get_arg(vm, arg_log_file), true);
  if (auto level = get_arg(vm, arg_log_level); !level.empty())
    mlog_set_log(level.c_str());
}

}
