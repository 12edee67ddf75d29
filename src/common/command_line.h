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

#pragma once

#include <initializer_list>
#include <iostream>
#include <string>

#include <boost/program_options/parsers.hpp>
#include <boost/program_options/options_description.hpp>
#include <boost/program_options/variables_map.hpp>
#include "epee/misc_log_ex.h"

namespace command_line
{
  template<typename T>
  struct arg_descriptor
  {
    using value_type = T;

    const char* name;
    const char* description;
    T default_value;
  };

  template<typename T>
  boost::program_options::typed_value<T, char>* make_semantic(const arg_descriptor<T>& arg)
  {
    return boost::program_options::value<T>()->default_value(arg.default_value);
  }

  template<typename T>
  void add_arg(boost::program_options::options_description& description, const arg_descriptor<T>& arg, bool unique = true)
  {
    if (0 != description.find_nothrow(arg.name, false))
    {
      CHECK_AND_ASSERT_MES(!unique, void(), "Argument already exists: " << arg.name);
      return;
    }

    description.add_options()(arg.name, make_semantic(arg), arg.description);
  }

  template<>
  inline void add_arg(boost::program_options::options_description& description, const arg_descriptor<bool>& arg, bool unique)
  {
    if (0 != description.find_nothrow(arg.name, false))
    {
      CHECK_AND_ASSERT_MES(!unique, void(), "Argument already exists: " << arg.name);
      return;
    }

    description.add_options()(arg.name, boost::program_options::bool_switch(), arg.description);
  }

  template<typename F>
  bool handle_error_helper(const boost::program_options::options_description& desc, F parser)
  {
    try
    {
      return parser();
    }
    catch (const std::exception& e)
    {
      std::cerr << "Failed to parse arguments: " << e.what() << std::endl;
      std::cerr << desc << std::endl;
      return false;
    }
  }

  template<typename T>
  T get_arg(const boost::program_options::variables_map& vm, const arg_descriptor<T>& arg)
  {
    return vm[arg.name].template as<T>();
  }

  /// Returns a string option, throwing std::runtime_error if it was left empty.  Options that only
  /// some commands need are declared optional and checked here by the command that uses them.
  std::string get_required_arg(const boost::program_options::variables_map& vm, const arg_descriptor<std::string>& arg);

  /// Decodes a hex option (surrounding whitespace and an optional 0x prefix allowed), throwing
  /// std::runtime_error if it is empty, not hex, or not one of `sizes` bytes long (any size if
  /// `sizes` is empty).
  std::string get_hex_arg(const boost::program_options::variables_map& vm, const arg_descriptor<std::string>& arg,
      std::initializer_list<size_t> sizes = {});

  extern const arg_descriptor<bool> arg_help;
  extern const arg_descriptor<bool> arg_version;
  extern const arg_descriptor<std::string> arg_log_level;
  extern const arg_descriptor<std::string> arg_log_file;

  /// Applies --log-file and --log-level: configures epee logging to the given file (or console
  /// only when empty) and sets the level/categories string, e.g. "1" or "device.apdu:DEBUG".
  void configure_logging(const boost::program_options::variables_map& vm);
}
