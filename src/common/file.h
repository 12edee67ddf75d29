// Copyright (c) 2024, The XELIS Ledger Sign Project
// Copyright (c) 2018-2020, The Beldex Project
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
//

#pragma once

#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>

namespace fs {
  using namespace std::filesystem;
  using ifstream = std::ifstream;
  using ofstream = std::ofstream;
}

/**
 * Utilities for reading bundles and writing attestation records.
 */

namespace tools {

  /// Reads a (binary) file from disk into the string `contents`.
  bool slurp_file(const fs::path& filename, std::string& contents);

  /// Dumps (binary) string contents to disk. The file is overwritten if it already exists.
  bool dump_file(const fs::path& filename, std::string_view contents);

  /// Writes `contents` to a uniquely named sibling temporary file, syncs it to disk and renames it
  /// over `filename`, so that `filename` either keeps its old contents or holds the complete new
  /// contents.  The new file is mode 0644.
  bool dump_file_atomic(const fs::path& filename, std::string_view contents);

}
