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

#include "debug_report.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <type_traits>
#include <oxenmq/hex.h>
#include <oxenmq/variant.h>
#include "epee/misc_log_ex.h"

namespace hw {

    namespace ledger {

    #undef BELDEX_DEFAULT_LOG_CATEGORY
    #define BELDEX_DEFAULT_LOG_CATEGORY "device.report"

    using namespace std::literals;

    std::string_view to_string(test_outcome o)
    {
      switch (o) {
        case test_outcome::pass: return "PASS"sv;
        case test_outcome::fail: return "FAIL"sv;
        case test_outcome::mismatch: return "MISMATCH"sv;
      }
      return "?"sv;
    }

    test_outcome key_case::outcome() const
    {
      if (!derived)
        return test_outcome::fail;
      return matches.value_or(false) ? test_outcome::pass : test_outcome::mismatch;
    }

    test_outcome address_result::outcome() const
    {
      if (result == ADDRESS_RESULT_PASS)
        return test_outcome::pass;
      if (result == ADDRESS_RESULT_FAIL)
        return test_outcome::fail;
      return test_outcome::mismatch;
    }

    const report_fixture::identity* report_fixture::by_key_marker(uint8_t marker) const
    {
      for (auto& id : identities)
        if (id.key_marker == marker)
          return &id;
      return nullptr;
    }

    const report_fixture::identity* report_fixture::by_address_marker(uint8_t marker) const
    {
      for (auto& id : identities)
        if (id.address_marker == marker)
          return &id;
      return nullptr;
    }

    namespace {

    std::string hex_byte(uint8_t b)
    {
      std::ostringstream s;
      s << "0x" << std::hex << std::setw(2) << std::setfill('0') << +b;
      return s.str();
    }

    bool is_key_case(uint8_t m) { return m >= report_marker::key_case_first && m <= report_marker::key_case_last; }
    bool is_address_case(uint8_t m) { return m >= report_marker::address_case_first && m <= report_marker::address_case_last; }

    // Single forward pass over a report.  Reads never run past the end; short reads are reported
    // to the caller, which records them.
    class report_reader {
    public:
      report_reader(std::string_view buf, std::vector<std::string>& annotations)
        : m_buf{buf}, m_notes{annotations} {}

      bool done() const { return m_off >= m_buf.size(); }
      size_t offset() const { return m_off; }
      uint8_t peek() const { return static_cast<uint8_t>(m_buf[m_off]); }
      uint8_t next() { return static_cast<uint8_t>(m_buf[m_off++]); }
      bool next_is(uint8_t m) const { return !done() && peek() == m; }

      std::optional<uint8_t> read_byte(std::string_view what) {
        if (done()) {
          note(std::string{what} + " missing at end of report");
          return std::nullopt;
        }
        return next();
      }

      // Reads up to n bytes into out; returns false if fewer than n were available.
      bool read_bytes(size_t n, std::string& out, std::string_view what) {
        size_t avail = std::min(n, m_buf.size() - m_off);
        out = m_buf.substr(m_off, avail);
        m_off += avail;
        if (avail < n) {
          note(std::string{what} + ": expected " + std::to_string(n) + " bytes, only " + std::to_string(avail) + " present");
          return false;
        }
        return true;
      }

      std::string_view rest() {
        auto r = m_buf.substr(m_off);
        m_off = m_buf.size();
        return r;
      }

      void note(std::string msg) {
        MDEBUG("Report decode: " << msg);
        m_notes.push_back(std::move(msg));
      }

    private:
      std::string_view m_buf;
      size_t m_off = 0;
      std::vector<std::string>& m_notes;
    };

    derivation_case read_derivation_case(report_reader& r)
    {
      derivation_case c;
      auto success = r.read_byte("derivation result");
      if (!success) {
        c.truncated = true;
        return c;
      }
      c.derived = *success == 0x01;
      if (!c.derived)
        return c;

      if (!r.read_bytes(DERIVATION_EXCERPT_SIZE, c.raw_key, "derived key excerpt")
          || !(c.reduce_marker = r.read_byte("reduce marker"))
          || !r.read_bytes(DERIVATION_EXCERPT_SIZE, c.clamped_key, "clamped key excerpt")) {
        c.truncated = true;
        return c;
      }
      auto pk = r.read_byte("public key result");
      if (!pk) {
        c.truncated = true;
        return c;
      }
      c.public_key_derived = *pk == 0x01;
      if (*c.public_key_derived && !r.read_bytes(DERIVATION_EXCERPT_SIZE, c.public_key, "public key excerpt"))
        c.truncated = true;
      return c;
    }

    derivation_debug read_derivation(report_reader& r)
    {
      derivation_debug d;
      r.next(); // section marker
      if (r.next_is(report_marker::derivation_case)) {
        r.next();
        d.test = read_derivation_case(r);
      }
      // Tolerate diagnostic bytes up to the terminator; the key matrix marker also ends the section.
      while (!r.done() && r.peek() != report_marker::derivation_end && r.peek() != report_marker::key_matrix)
        d.unannotated += static_cast<char>(r.next());
      if (r.next_is(report_marker::derivation_end)) {
        r.next();
        d.terminated = true;
      } else {
        r.note("derivation debug section has no terminator");
      }
      if (!d.unannotated.empty())
        r.note(std::to_string(d.unannotated.size()) + " unannotated bytes in derivation debug section");
      return d;
    }

    key_matrix read_key_matrix(report_reader& r)
    {
      key_matrix km;
      r.next(); // section marker
      while (!r.done()) {
        uint8_t m = r.peek();
        if (m == report_marker::key_matrix_end) {
          r.next();
          km.terminated = true;
          break;
        }
        if (m == report_marker::address_matrix || m == report_marker::derivation)
          break;
        r.next();
        if (!is_key_case(m)) {
          km.unannotated += static_cast<char>(m);
          continue;
        }
        key_case c{m};
        auto success = r.read_byte("key derivation result of case " + hex_byte(m));
        if (success) {
          c.derived = *success == 0x01;
          if (c.derived) {
            if (auto match = r.read_byte("key match flag of case " + hex_byte(m)))
              c.matches = *match == 0x01;
          }
        }
        km.cases.push_back(c);
      }
      if (!km.terminated)
        r.note("key derivation matrix has no terminator");
      if (!km.unannotated.empty())
        r.note(std::to_string(km.unannotated.size()) + " unannotated bytes in key derivation matrix");
      return km;
    }

    std::optional<address_result> read_address_result(report_reader& r, std::string_view what)
    {
      auto b = r.read_byte(what);
      if (!b)
        return std::nullopt;
      address_result res{*b};
      if (res.outcome() != test_outcome::mismatch)
        return res;

      res.actual_len = r.read_byte(std::string{what} + " actual length");
      if (!res.actual_len) {
        res.truncated = true;
        return res;
      }
      res.expected_len = r.read_byte(std::string{what} + " expected length");
      if (!res.expected_len) {
        res.truncated = true;
        return res;
      }
      size_t n = std::min<size_t>(ADDRESS_EXCERPT_MAX, *res.actual_len);
      res.truncated = !r.read_bytes(n, res.excerpt, std::string{what} + " excerpt");
      return res;
    }

    address_matrix read_address_matrix(report_reader& r)
    {
      address_matrix am;
      r.next(); // section marker
      while (!r.done()) {
        uint8_t m = r.next();
        if (m == report_marker::address_matrix_end) {
          am.terminated = true;
          break;
        }
        if (!is_address_case(m)) {
          am.unannotated += static_cast<char>(m);
          continue;
        }
        address_case c{m};
        c.mainnet = read_address_result(r, "mainnet result of case " + hex_byte(m));
        if (!r.done() && !is_address_case(r.peek()) && r.peek() != report_marker::address_matrix_end)
          c.testnet = read_address_result(r, "testnet result of case " + hex_byte(m));
        am.cases.push_back(std::move(c));
      }
      if (!am.terminated)
        r.note("address generation matrix has no terminator");
      if (!am.unannotated.empty())
        r.note(std::to_string(am.unannotated.size()) + " unannotated bytes in address generation matrix");
      return am;
    }

    } // anon namespace

    debug_report decode_report(std::string_view response)
    {
      debug_report report;
      report_reader r{response, report.annotations};
      if (r.done()) {
        r.note("empty report");
        return report;
      }

      report.kind = r.next();
      if (!report.known_kind()) {
        r.note("unknown report kind " + hex_byte(*report.kind));
        if (!r.done())
          report.sections.push_back(unparsed_tail{r.offset(), std::string{r.rest()}});
        return report;
      }

      while (!r.done()) {
        switch (r.peek()) {
          case report_marker::derivation:
            report.sections.push_back(read_derivation(r));
            break;
          case report_marker::key_matrix:
            report.sections.push_back(read_key_matrix(r));
            break;
          case report_marker::address_matrix:
            report.sections.push_back(read_address_matrix(r));
            break;
          default:
            r.note("unrecognized section marker " + hex_byte(r.peek()) + " at offset " + std::to_string(r.offset()));
            size_t off = r.offset();
            report.sections.push_back(unparsed_tail{off, std::string{r.rest()}});
        }
      }
      return report;
    }

    bool debug_report::all_passed() const
    {
      if (!known_kind() || !annotations.empty())
        return false;
      for (auto& s : sections) {
        bool ok = var::visit([](const auto& sec) {
          using T = std::decay_t<decltype(sec)>;
          if constexpr (std::is_same_v<T, derivation_debug>)
            return sec.test && sec.test->derived && sec.test->public_key_derived.value_or(false);
          else if constexpr (std::is_same_v<T, key_matrix>)
            return std::all_of(sec.cases.begin(), sec.cases.end(), [](auto& c) { return c.outcome() == test_outcome::pass; });
          else if constexpr (std::is_same_v<T, address_matrix>)
            return std::all_of(sec.cases.begin(), sec.cases.end(), [](auto& c) {
              return c.mainnet && c.mainnet->outcome() == test_outcome::pass
                && (!c.testnet || c.testnet->outcome() == test_outcome::pass); });
          else
            return false;
        }, s);
        if (!ok)
          return false;
      }
      return true;
    }

    namespace {

    std::string printable(std::string_view bytes)
    {
      bool text = std::all_of(bytes.begin(), bytes.end(), [](char c) { return c >= 0x20 && c < 0x7f; });
      return text ? "\"" + std::string{bytes} + "\"" : oxenmq::to_hex(bytes);
    }

    struct section_printer {
      std::ostringstream& out;
      const report_fixture& fixture;

      void operator()(const derivation_debug& d) const {
        out << "--- BIP32 derivation debug ---\n";
        if (!d.test) {
          out << "  (no derivation case)\n";
        } else if (!d.test->derived) {
          out << "  BIP32 derivation: FAIL\n";
        } else {
          auto& c = *d.test;
          out << "  BIP32 derivation: ok\n"
              << "    raw key (first 8): " << oxenmq::to_hex(c.raw_key) << "\n"
              << "    clamped (first 8): " << oxenmq::to_hex(c.clamped_key) << "\n";
          if (c.public_key_derived)
            out << "  public key derivation: " << (*c.public_key_derived ? "ok" : "FAIL") << "\n";
          if (!c.public_key.empty())
            out << "    public key (first 8): " << oxenmq::to_hex(c.public_key) << "\n";
          if (c.truncated)
            out << "  (truncated)\n";
        }
        if (!d.unannotated.empty())
          out << "  unannotated: " << oxenmq::to_hex(d.unannotated) << "\n";
      }

      void operator()(const key_matrix& km) const {
        out << "--- Key derivation matrix ---\n";
        for (auto& c : km.cases) {
          auto* id = fixture.by_key_marker(c.marker);
          out << "  [" << hex_byte(c.marker) << "] " << (id ? id->name : "unknown case"s) << ": " << to_string(c.outcome()) << "\n";
          if (id && c.outcome() != test_outcome::pass)
            out << "      expected key: " << id->expected_public_key_hex << "\n";
        }
        if (!km.unannotated.empty())
          out << "  unannotated: " << oxenmq::to_hex(km.unannotated) << "\n";
      }

      void result(std::string_view net, const std::optional<address_result>& res, const std::string* expected) const {
        if (!res) {
          out << "      " << net << ": (absent)\n";
          return;
        }
        out << "      " << net << ": " << to_string(res->outcome());
        if (res->outcome() == test_outcome::mismatch) {
          if (res->actual_len)
            out << " (length " << +*res->actual_len;
          if (res->expected_len)
            out << ", expected " << +*res->expected_len;
          if (res->actual_len)
            out << ")";
          if (!res->excerpt.empty())
            out << " starts " << printable(res->excerpt);
          if (res->truncated)
            out << " [truncated]";
          if (expected)
            out << "\n        expected " << *expected;
        }
        out << "\n";
      }

      void operator()(const address_matrix& am) const {
        out << "--- Address generation matrix ---\n";
        for (auto& c : am.cases) {
          auto* id = fixture.by_address_marker(c.marker);
          out << "  [" << hex_byte(c.marker) << "] " << (id ? id->name : "unknown case"s) << "\n";
          result("mainnet", c.mainnet, id ? &id->expected_mainnet_address : nullptr);
          result("testnet", c.testnet, id ? &id->expected_testnet_address : nullptr);
        }
        if (!am.unannotated.empty())
          out << "  unannotated: " << oxenmq::to_hex(am.unannotated) << "\n";
      }

      void operator()(const unparsed_tail& t) const {
        out << "--- Unparsed data at offset " << t.offset << " (" << t.bytes.size() << " bytes) ---\n"
            << "  " << oxenmq::to_hex(t.bytes) << "\n";
      }
    };

    } // anon namespace

    std::string format_report(const debug_report& report, const report_fixture& fixture)
    {
      std::ostringstream out;
      if (!report.kind)
        out << "=== EMPTY REPORT ===\n";
      else if (report.known_kind())
        out << "=== DEVICE SELF-TESTS ===\n";
      else
        out << "=== UNKNOWN REPORT KIND " << hex_byte(*report.kind) << " ===\n";

      section_printer printer{out, fixture};
      for (auto& s : report.sections)
        var::visit(printer, s);

      for (auto& a : report.annotations)
        out << "note: " << a << "\n";
      if (report.known_kind())
        out << (report.all_passed() ? "All tests passed\n" : "Some tests failed or were incomplete\n");
      return out.str();
    }

    }
}
