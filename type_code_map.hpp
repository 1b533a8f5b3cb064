/**
 * bai2 recon - version 1.00
 * --------------------------------------------------------
 * BAI2 cash-position parser and open-invoice matcher
 *
 * SPDX-FileCopyrightText: 2025 psynectic
 * SPDX-License-Identifier: MIT
 *
 */

#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <unordered_map>
#include <sstream>
#include <algorithm>
#include <charconv>
#include <cctype>


namespace bai2 {

// ----------------------------- Embedded CSV -----------------------------
// Format:
// CODE;DC;LABEL
// Labels follow the bank's online-banking export, not the BAI2 code list.
inline constexpr const char* kTypeCodeCsvEmbedded =
    "CODE;DC;LABEL\n"
    "169;C;ACH CREDIT\n"
    "174;C;Miscellaneous ACH Credit\n"
    "195;C;WIRE TRANSFER CREDIT\n"
    "214;C;FX Wire Transfer Credit\n"
    "301;C;MOBILE DEPOSIT\n"
    "469;D;ACH DEBIT\n"
    "495;D;WIRE TRANSFER DEBIT\n"
    "496;D;FX Wire Transfer Debit\n"
    "575;D;ZERO BAL TRF DEBIT\n";

inline std::string trim_copy(std::string_view sv) {
    auto is_space = [](unsigned char c){ return std::isspace(c) != 0; };
    size_t b = 0, e = sv.size();
    while (b < e && is_space(static_cast<unsigned char>(sv[b]))) ++b;
    while (e > b && is_space(static_cast<unsigned char>(sv[e-1]))) --e;
    return std::string(sv.substr(b, e - b));
}

inline std::vector<std::string> split_semicolon(std::string_view line) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= line.size()) {
        size_t pos = line.find(';', start);
        if (pos == std::string_view::npos) {
            out.emplace_back(trim_copy(line.substr(start)));
            break;
        }
        out.emplace_back(trim_copy(line.substr(start, pos - start)));
        start = pos + 1;
    }
    return out;
}

// Numeric value of a type code; false for anything that is not an integer.
inline bool type_code_value(std::string_view code, int& out) {
    std::string s = trim_copy(code);
    std::string_view v = s;
    if (!v.empty() && v.front() == '+') v.remove_prefix(1);
    if (v.empty()) return false;
    int value = 0;
    auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), value);
    if (ec != std::errc() || p != v.data() + v.size()) return false;
    out = value;
    return true;
}

// 100-399 = credit (money in). 400-699 and anything unparseable count as debit.
inline bool is_credit_type(std::string_view code) {
    int v = 0;
    if (!type_code_value(code, v)) return false;
    return v >= 100 && v <= 399;
}

// Key = "169" (type code exactly as reported)
// Val = "ACH CREDIT"
using TypeCodeMap = std::unordered_map<std::string, std::string>;

// Builds the map from CSV text in the embedded format.
inline TypeCodeMap build_type_code_map(std::string_view csv) {
    TypeCodeMap map;
    std::istringstream iss{std::string(csv)};
    std::string line;
    while (std::getline(iss, line)) {
        auto cols = split_semicolon(line);
        if (cols.size() < 3)
            continue;
        if (cols[0] == "CODE") continue; // Header
        if (cols[0].empty() || cols[2].empty()) continue;
        // DC must agree with the numeric credit range
        const char* dc = is_credit_type(cols[0]) ? "C" : "D";
        if (cols[1] != dc) continue;
        map.emplace(cols[0], cols[2]);
    }
    return map;
}

inline TypeCodeMap build_type_code_map_from_embedded() {
    return build_type_code_map(kTypeCodeCsvEmbedded);
}

// Singleton access (build once, then reuse)
inline const TypeCodeMap& get_type_code_map() {
    static const TypeCodeMap M = build_type_code_map_from_embedded();
    return M;
}

inline std::string lookup_type_label(const TypeCodeMap& m, const std::string& code) {
    if (auto it = m.find(code); it != m.end()) return it->second;
    return (is_credit_type(code) ? "Credit (" : "Debit (") + code + ")";
}

inline std::string type_code_label(const std::string& code) {
    return lookup_type_label(get_type_code_map(), code);
}

} // namespace bai2
