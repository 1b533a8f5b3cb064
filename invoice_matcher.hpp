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
#include "bai2_csv.hpp"
#include "fuzzy_ratio.hpp"
#include "invoice_model.hpp"
#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace bai2 {

/*
 Scoring (out of 100):
   amount equal (< 0.01 apart)      50
   amount within 1%                 30
   customer name in memo            0..50 (token-set similarity)
 A match is accepted at >= min_score. Equal scores go to the invoice whose
 remaining amount is closer to the credit.
*/
constexpr int kAmountExactPts = 50;
constexpr int kAmountClosePts = 30;
constexpr int kNameMaxPts     = 50;
constexpr int kMinMatchScore  = 60;

struct MatchOptions {
    int  min_score = kMinMatchScore;

    // where the matcher reads its inputs (compact transaction sheet by default)
    std::size_t credit_column      = to_index(TxnField::CreditAmount);
    std::size_t description_column = to_index(TxnField::Description);

    std::string link_label = "Open invoice";
};

// Columns appended to every transaction row
enum class MatchField {
    MatchedCustomer,
    InvoiceNumber,
    Confidence,
    InvoiceLink,
    Count
};

inline const std::array<const char*, to_index(MatchField::Count)>& match_columns() {
    static const std::array<const char*, to_index(MatchField::Count)> cols = {
        "Matched Customer", "Invoice #", "Confidence", "Invoice Link"
    };
    return cols;
}

inline int amount_score(double txnAmount, double invAmount) {
    if (txnAmount <= 0 || invAmount <= 0) return 0;
    const double diff = std::fabs(txnAmount - invAmount);
    if (diff < 0.01) return kAmountExactPts;
    if (diff / std::max(txnAmount, invAmount) <= 0.01) return kAmountClosePts;
    return 0;
}

inline int name_score(std::string_view description, std::string_view customerName) {
    if (description.empty() || customerName.empty()) return 0;
    return static_cast<int>(std::lround(name_similarity(description, customerName) * kNameMaxPts / 100.0));
}

// "1,500.00" -> 1500.0; false for empty or non-numeric text.
// '.' is always the decimal point, ',' always groups (locale independent).
inline bool parse_credit_amount(std::string_view cell, double& out) {
    std::string s;
    s.reserve(cell.size());
    for (char c : cell) if (c != ',') s.push_back(c);
    s = trim_copy(s);

    std::string_view v = s;
    bool neg = false;
    if (!v.empty() && (v.front()=='+' || v.front()=='-')) {
        neg = v.front()=='-';
        v.remove_prefix(1);
    }

    const size_t dot = v.find('.');
    const std::string_view intp = v.substr(0, dot);
    const std::string_view frac = dot == std::string_view::npos ? std::string_view() : v.substr(dot + 1);
    if (intp.empty() && frac.empty()) return false;

    std::string digits;
    digits.append(intp.data(), intp.size()).append(frac.data(), frac.size());
    if (digits.size() > 18) return false;
    for (unsigned char c : digits) if (c < '0' || c > '9') return false;

    std::int64_t scaled = 0;
    auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), scaled);
    if (ec != std::errc() || p != digits.data() + digits.size()) return false;

    double scale = 1.0;
    for (size_t i = 0; i < frac.size(); ++i) scale *= 10.0;
    const double value = static_cast<double>(scaled) / scale;
    out = neg ? -value : value;
    return true;
}

struct MatchResult {
    const Invoice* invoice = nullptr;
    int score = 0;
};

// Highest total over all invoices; ties go to the closer remaining amount,
// then to the earlier invoice.
inline MatchResult best_invoice(double txnAmount, std::string_view description,
                                const std::vector<Invoice>& invoices, const MatchOptions& opt = {}) {
    MatchResult best;
    double bestDiff = 0;

    for (const auto& inv : invoices) {
        const double invAmount = to_major(inv.amountRemaining);
        const int aScore = amount_score(txnAmount, invAmount);
        // no name score can lift this invoice to the threshold
        if (aScore + kNameMaxPts < opt.min_score) continue;

        const int total = aScore + name_score(description, inv.customerName);
        const double diff = std::fabs(txnAmount - invAmount);

        if (total > best.score) {
            best.invoice = &inv;
            best.score = total;
            bestDiff = diff;
        } else if (total == best.score && best.invoice && diff < bestDiff) {
            best.invoice = &inv;
            bestDiff = diff;
        }
    }
    return best;
}

inline std::string hyperlink_formula(const std::string& url, const std::string& label) {
    auto quote = [](const std::string& s) {
        std::string out;
        for (char c : s) { out.push_back(c); if (c == '"') out.push_back('"'); }
        return out;
    };
    return "=HYPERLINK(\"" + quote(url) + "\",\"" + quote(label) + "\")";
}

inline const std::string& cell_text(const ExportRow& row, std::size_t i) {
    static const std::string kEmpty;
    return i < row.size() ? row[i].first : kEmpty;
}

// Same rows in the same order, each extended by the MatchField columns.
// Only rows with a positive credit amount are matched; all others get empty
// match columns. hasTitle must mirror ExportOptions::include_header of the
// projection that produced `rows`: a header row gets the column names.
inline ExportData match_transactions(const ExportData& rows, const std::vector<Invoice>& invoices,
                                     bool hasTitle, const MatchOptions& opt = {}) {
    ExportData out;
    out.reserve(rows.size());

    for (std::size_t r = 0; r < rows.size(); ++r) {
        ExportRow row = rows[r];

        if (r == 0 && hasTitle) {
            for (const char* name : match_columns()) row.emplace_back(name, "");
            out.push_back(std::move(row));
            continue;
        }

        std::string customer, number, confidence, link;
        double amount = 0;
        if (parse_credit_amount(cell_text(row, opt.credit_column), amount) && amount > 0) {
            const MatchResult m = best_invoice(amount, cell_text(row, opt.description_column), invoices, opt);
            if (m.invoice && m.score >= opt.min_score) {
                customer   = m.invoice->customerName;
                number     = m.invoice->number;
                confidence = std::to_string(std::min(m.score, 100)) + "%";
                if (!m.invoice->url.empty())
                    link = hyperlink_formula(m.invoice->url, opt.link_label);
            }
        }

        row.emplace_back(customer, customer);
        row.emplace_back(number, number);
        row.emplace_back(confidence, confidence);
        row.emplace_back(link, link);
        out.push_back(std::move(row));
    }
    return out;
}

// ----------------------- re-run support ------------------

// Identity of a transaction row across runs: Date, Credit Amount, Description, Bank Ref #
inline std::string match_key(const ExportRow& row) {
    std::string key;
    for (TxnField f : { TxnField::Date, TxnField::CreditAmount, TxnField::Description, TxnField::BankRef }) {
        key.append(cell_text(row, to_index(f)));
        key.push_back('\x1F');       // Unit Separator
    }
    return key;
}

inline std::unordered_set<std::string> collect_match_keys(const ExportData& rows, bool hasTitle) {
    std::unordered_set<std::string> keys;
    for (std::size_t r = hasTitle ? 1 : 0; r < rows.size(); ++r)
        keys.insert(match_key(rows[r]));
    return keys;
}

// Drops rows already present in a previous cash-application sheet; keeps the header.
inline ExportData filter_unmatched(const ExportData& rows, const std::unordered_set<std::string>& seen, bool hasTitle) {
    ExportData out;
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (r == 0 && hasTitle) { out.push_back(rows[r]); continue; }
        if (seen.count(match_key(rows[r]))) continue;
        out.push_back(rows[r]);
    }
    return out;
}

// rows of match_transactions() output that carry an invoice number
inline std::size_t count_matches(const ExportData& rows, bool hasTitle) {
    const std::size_t n = to_index(MatchField::Count);
    std::size_t count = 0;
    for (std::size_t r = hasTitle ? 1 : 0; r < rows.size(); ++r) {
        const auto& row = rows[r];
        if (row.size() < n) continue;
        if (!row[row.size() - n + to_index(MatchField::InvoiceNumber)].first.empty()) ++count;
    }
    return count;
}

} // namespace bai2
