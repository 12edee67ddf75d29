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

#include "file.h"
#include "epee/misc_log_ex.h"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#undef BELDEX_DEFAULT_LOG_CATEGORY
#define BELDEX_DEFAULT_LOG_CATEGORY "util"

namespace tools {

  bool slurp_file(const fs::path& filename, std::string& contents)
  {
    fs::ifstream in;
    in.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    try {
      in.open(filename, std::ios::binary | std::ios::in | std::ios::ate);
      contents.clear();
      contents.resize(in.tellg());
      in.seekg(0);
      in.read(contents.data(), contents.size());
      auto bytes_read = in.gcount();
      if (static_cast<size_t>(bytes_read) < contents.size())
        contents.resize(bytes_read);
      return true;
    } catch (const std::exception& e) {
      MERROR("Failed to read " << filename << ": " << e.what());
      return false;
    }
  }

  bool dump_file(const fs::path& filename, std::string_view contents)
  {
    fs::ofstream out;
    out.exceptions(std::ifstream::failbit | std::ifstream::badbit);
    try {
      out.open(filename, std::ios::binary | std::ios::out | std::ios::trunc);
      out.write(contents.data(), contents.size());
      out.flush();
      return true;
    } catch (const std::exception& e) {
      MERROR("Failed to write " << filename << ": " << e.what());
      return false;
    }
  }

  namespace {
    bool write_all(int fd, std::string_view contents)
    {
      while (!contents.empty())
      {
        ssize_t n = ::write(fd, contents.data(), contents.size());
        if (n < 0)
        {
          if (errno == EINTR)
            continue;
          return false;
        }
        contents.remove_prefix(static_cast<size_t>(n));
      }
      return true;
    }

    void sync_directory(const fs::path& dir)
    {
      int fd = ::open(dir.empty() ? "." : dir.c_str(), O_RDONLY | O_DIRECTORY);
      if (fd < 0)
      {
        MWARNING("Failed to open " << dir << " to sync it: " << std::strerror(errno));
        return;
      }
      if (::fsync(fd) != 0)
        MWARNING("Failed to sync directory " << dir << ": " << std::strerror(errno));
      ::close(fd);
    }
  }

  bool dump_file_atomic(const fs::path& filename, std::string_view contents)
  {
    std::string tmp = filename.string() + ".XXXXXX";
    int fd = ::mkstemp(tmp.data());
    if (fd < 0)
    {
      MERROR("Failed to create a temporary file for " << filename << ": " << std::strerror(errno));
      return false;
    }

    const char* failed = nullptr;
    if (!write_all(fd, contents))
      failed = "write";
    else if (::fchmod(fd, 0644) != 0)
      failed = "chmod";
    else if (::fsync(fd) != 0)
      failed = "sync";
    int err = errno;
    if (::close(fd) != 0 && !failed)
    {
      failed = "close";
      err = errno;
    }
    if (!failed && ::rename(tmp.c_str(), filename.c_str()) != 0)
    {
      failed = "rename";
      err = errno;
    }
    if (failed)
    {
      MERROR("Failed to " << failed << " " << tmp << " for " << filename << ": " << std::strerror(err));
      ::unlink(tmp.c_str());
      return false;
    }

    sync_directory(filename.parent_path());
    return true;
  }
}
