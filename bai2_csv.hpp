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
#include "bai2_model.hpp"
#include "type_code_map.hpp"
#include <array>
#include <charconv>
#include <cstdint>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bai2 {

struct ExportOptions {
    char delimiter = ',';
    bool include_header = true;
    bool write_utf8_bom = false;   // Excel-compatible

    // constant columns of the transaction sheet
    std::string account_title = "AR Account";
    std::string entity;
};

// Each cell: first = display value (CSV), second = canonical value (keys, comparison)
using ExportRow = std::vector<std::pair<std::string,std::string>>;
using ExportData = std::vector<ExportRow>;

// Compact transaction sheet, context inherited from the transaction snapshot
enum class TxnField {
    Date,
    BankId,
    AccountNumber,
    AccountTitle,
    Entity,
    TranType,
    BaiTypeCode,
    Currency,
    CreditAmount,
    DebitAmount,
    BankRef,
    EndToEndId,
    CustomerRef,
    Description,
    ReasonForPayment,
    Notes,
    Count // Array size
};

// One row per 03 status/summary quadruple, all ancestors denormalized
enum class BalanceField {
    FileSenderId,
    FileReceiverId,
    FileCreationDate,
    FileCreationTime,
    ResendIndicator,
    GroupOriginatorId,
    GroupReceiverId,
    GroupStatus,
    AsOfDate,
    AsOfTime,
    AsOfDateModifier,
    CurrencyCode,
    CustomerAccount,
    BalanceTypeCode,
    BalanceAmount,
    BalanceItemCount,
    BalanceFundsType,
    AccountControlTotal,
    AccountRecordCount,
    GroupControlTotal,
    GroupAccountCount,
    GroupRecordCount,
    FileControlTotal,
    FileGroupCount,
    FileRecordCount,
    Count
};

// One row per 16 record, all ancestors denormalized
enum class DetailField {
    FileSenderId,
    FileReceiverId,
    FileCreationDate,
    FileCreationTime,
    ResendIndicator,
    GroupOriginatorId,
    GroupReceiverId,
    GroupStatus,
    AsOfDate,
    AsOfTime,
    AsOfDateModifier,
    CurrencyCode,
    CustomerAccount,
    TypeCode,
    IsCredit,
    Amount,
    FundsType,
    BankRef,
    CustomerRef,
    Text,
    AccountControlTotal,
    AccountRecordCount,
    GroupControlTotal,
    GroupAccountCount,
    GroupRecordCount,
    FileControlTotal,
    FileGroupCount,
    FileRecordCount,
    Count
};

template <typename Field>
constexpr std::size_t to_index(Field f) noexcept {
    return static_cast<std::size_t>(f);
}

inline const std::array<const char*, to_index(TxnField::Count)>& txn_columns() {
    static const std::array<const char*, to_index(TxnField::Count)> cols = {
        "Date", "Bank ID", "Account Number", "Account Title", "Entity",
        "Tran Type", "BAI Type Code", "Currency", "Credit Amount", "Debit Amount",
        "Bank Ref #", "End to End ID", "Customer Ref #", "Description",
        "Reason for Payment", "Notes"
    };
    return cols;
}

inline const std::array<const char*, to_index(BalanceField::Count)>& balance_columns() {
    static const std::array<const char*, to_index(BalanceField::Count)> cols = {
        "file_sender_id", "file_receiver_id", "file_creation_date", "file_creation_time",
        "resend_indicator", "group_originator_id", "group_receiver_id", "group_status",
        "as_of_date", "as_of_time", "as_of_date_modifier", "currency_code",
        "customer_account", "balance_type_code", "balance_amount", "balance_item_count",
        "balance_funds_type", "account_control_total", "account_record_count",
        "group_control_total", "group_account_count", "group_record_count",
        "file_control_total", "file_group_count", "file_record_count"
    };
    return cols;
}

inline const std::array<const char*, to_index(DetailField::Count)>& detail_columns() {
    static const std::array<const char*, to_index(DetailField::Count)> cols = {
        "file_sender_id", "file_receiver_id", "file_creation_date", "file_creation_time",
        "resend_indicator", "group_originator_id", "group_receiver_id", "group_status",
        "as_of_date", "as_of_time", "as_of_date_modifier", "currency_code",
        "customer_account", "type_code", "is_credit", "amount", "funds_type",
        "bank_ref", "customer_ref", "text", "account_control_total", "account_record_count",
        "group_control_total", "group_account_count", "group_record_count",
        "file_control_total", "file_group_count", "file_record_count"
    };
    return cols;
}

template <std::size_t N>
inline ExportRow header_row(const std::array<const char*, N>& names) {
    ExportRow row;
    row.reserve(N);
    for (const char* n : names) row.emplace_back(n, "");
    return row;
}

inline std::string csv_escape(const std::string& s, char delimiter) {
    bool needQuotes = s.find(delimiter) != std::string::npos ||
                      s.find('"')       != std::string::npos ||
                      s.find('\n')      != std::string::npos ||
                      s.find('\r')      != std::string::npos;
    std::string out = s;
    // double quotes
    for (size_t pos = 0; (pos = out.find('"', pos)) != std::string::npos; pos += 2)
        out.insert(pos, "\"");
    if (needQuotes) {
        out.insert(out.begin(), '"');
        out.push_back('"');
    }
    return out;
}

// ----------------------- value formatting ------------------

// "150000" -> display "1,500.00", canonical "1500.00".
// Returns false (outputs untouched) if raw is not an integer.
inline bool format_minor_amount(std::string_view raw, std::string& display, std::string& canonical) {
    std::string s = trim_copy(raw);
    std::string_view v = s;
    if (!v.empty() && v.front() == '+') v.remove_prefix(1);
    if (v.empty()) return false;

    std::int64_t minor = 0;
    auto [p, ec] = std::from_chars(v.data(), v.data() + v.size(), minor);
    if (ec != std::errc() || p != v.data() + v.size()) return false;

    const bool neg = minor < 0;
    const std::uint64_t absMinor = neg ? std::uint64_t(0) - static_cast<std::uint64_t>(minor)
                                       : static_cast<std::uint64_t>(minor);
    const std::string major = std::to_string(absMinor / 100);
    const std::uint64_t cents = absMinor % 100;

    std::string grouped;
    grouped.reserve(major.size() + major.size() / 3);
    for (size_t i = 0; i < major.size(); ++i) {
        if (i > 0 && (major.size() - i) % 3 == 0) grouped.push_back(',');
        grouped.push_back(major[i]);
    }

    std::string frac = (cents < 10 ? "0" : "") + std::to_string(cents);
    display   = (neg ? "-" : "") + grouped + "." + frac;
    canonical = (neg ? "-" : "") + major + "." + frac;
    return true;
}

inline std::string format_minor_amount(std::string_view raw) {
    std::string display, canonical;
    return format_minor_amount(raw, display, canonical) ? display : std::string(raw);
}

inline bool is_leap_year(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

inline bool is_valid_date(int y, int m, int d) {
    static const int kDays[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (y < 1 || m < 1 || m > 12 || d < 1) return false;
    int maxDay = kDays[m - 1];
    if (m == 2 && is_leap_year(y)) maxDay = 29;
    return d <= maxDay;
}

// "YYMMDD" / "YYYYMMDD" -> display "M/D/YYYY", canonical "YYYYMMDD".
// Two-digit years 69-99 are 19xx, 00-68 are 20xx.
inline bool parse_bai_date(std::string_view raw, std::string& display, std::string& canonical) {
    const std::string s = trim_copy(raw);
    if (s.size() != 6 && s.size() != 8) return false;
    for (unsigned char c : s) if (c < '0' || c > '9') return false;

    auto num = [&](size_t pos, size_t len) {
        int v = 0;
        for (size_t i = pos; i < pos + len; ++i) v = v * 10 + (s[i] - '0');
        return v;
    };

    int y, m, d;
    if (s.size() == 6) {
        y = num(0, 2);
        y += (y >= 69) ? 1900 : 2000;
        m = num(2, 2);
        d = num(4, 2);
    } else {
        y = num(0, 4);
        m = num(4, 2);
        d = num(6, 2);
    }
    if (!is_valid_date(y, m, d)) return false;

    display = std::to_string(m) + "/" + std::to_string(d) + "/" + std::to_string(y);
    canonical = std::to_string(y) + (m < 10 ? "0" : "") + std::to_string(m) + (d < 10 ? "0" : "") + std::to_string(d);
    return true;
}

inline std::string format_bai_date(std::string_view raw) {
    std::string display, canonical;
    return parse_bai_date(raw, display, canonical) ? display : trim_copy(raw);
}

// ----------------------- projections ------------------

namespace detail {

inline std::pair<std::string,std::string> cell(const std::string& s) { return { s, s }; }

inline std::pair<std::string,std::string> amount_cell(const std::string& raw) {
    std::string display, canonical;
    if (format_minor_amount(raw, display, canonical)) return { display, canonical };
    return { raw, raw };
}

inline std::pair<std::string,std::string> date_cell(const std::string& raw) {
    std::string display, canonical;
    if (parse_bai_date(raw, display, canonical)) return { display, canonical };
    return { raw, raw };
}

} // namespace detail

// Balances: file -> groups -> accounts -> balances
inline ExportData balance_rows(const File& file, const ExportOptions& opt = {}) {
    using detail::cell;
    ExportData out;
    if (opt.include_header) out.push_back(header_row(balance_columns()));

    for (const auto& g : file.groups) {
        for (const auto& a : g.accounts) {
            for (const auto& b : a.balances) {
                ExportRow row = {
                    cell(file.senderId),
                    cell(file.receiverId),
                    cell(file.creationDate),
                    cell(file.creationTime),
                    cell(file.resendIndicator),
                    cell(g.originatorId),
                    cell(g.ultimateReceiverId),
                    cell(g.status),
                    cell(g.asOfDate),
                    cell(g.asOfTime),
                    cell(g.asOfDateModifier),
                    cell(a.currency.empty() ? g.currency : a.currency),
                    cell(a.customerAccount),
                    cell(b.typeCode),
                    { b.amount, detail::amount_cell(b.amount).second },
                    cell(b.itemCount),
                    cell(b.fundsType),
                    cell(a.trailer.controlTotal),
                    cell(a.trailer.recordCount),
                    cell(g.trailer.controlTotal),
                    cell(g.trailer.childCount),
                    cell(g.trailer.recordCount),
                    cell(file.trailer.controlTotal),
                    cell(file.trailer.childCount),
                    cell(file.trailer.recordCount)
                };
                out.push_back(std::move(row));
            }
        }
    }
    return out;
}

// Compact transaction sheet. Context comes from the snapshot taken at parse
// time; credit and debit amount are mutually exclusive.
inline ExportData transaction_rows(const File& file, const ExportOptions& opt = {}) {
    using detail::cell;
    ExportData out;
    if (opt.include_header) out.push_back(header_row(txn_columns()));

    for (const auto& g : file.groups) {
        for (const auto& a : g.accounts) {
            for (const auto& t : a.transactions) {
                const bool credit = is_credit_type(t.typeCode);
                const auto amount = detail::amount_cell(t.amount);
                const std::pair<std::string,std::string> none;

                ExportRow row = {
                    detail::date_cell(t.context.asOfDate),
                    cell(t.context.bankId),
                    cell(t.context.accountId),
                    cell(opt.account_title),
                    cell(opt.entity),
                    cell(type_code_label(t.typeCode)),
                    cell(t.typeCode),
                    cell(t.context.currency),
                    credit ? amount : none,
                    credit ? none : amount,
                    cell(t.bankRef),
                    none,                       // End to End ID: not carried by BAI2
                    cell(t.customerRef),
                    cell(t.text),
                    none,
                    none
                };
                out.push_back(std::move(row));
            }
        }
    }
    return out;
}

// Full transaction view: ancestor values read from the tree, not the snapshot
inline ExportData transaction_detail_rows(const File& file, const ExportOptions& opt = {}) {
    using detail::cell;
    ExportData out;
    if (opt.include_header) out.push_back(header_row(detail_columns()));

    for (const auto& g : file.groups) {
        for (const auto& a : g.accounts) {
            for (const auto& t : a.transactions) {
                const std::string isCredit = is_credit_type(t.typeCode) ? "1" : "0";
                ExportRow row = {
                    cell(file.senderId),
                    cell(file.receiverId),
                    cell(file.creationDate),
                    cell(file.creationTime),
                    cell(file.resendIndicator),
                    cell(g.originatorId),
                    cell(g.ultimateReceiverId),
                    cell(g.status),
                    cell(g.asOfDate),
                    cell(g.asOfTime),
                    cell(g.asOfDateModifier),
                    cell(a.currency.empty() ? g.currency : a.currency),
                    cell(a.customerAccount),
                    cell(t.typeCode),
                    cell(isCredit),
                    { t.amount, detail::amount_cell(t.amount).second },
                    cell(t.fundsType),
                    cell(t.bankRef),
                    cell(t.customerRef),
                    cell(t.text),
                    cell(a.trailer.controlTotal),
                    cell(a.trailer.recordCount),
                    cell(g.trailer.controlTotal),
                    cell(g.trailer.childCount),
                    cell(g.trailer.recordCount),
                    cell(file.trailer.controlTotal),
                    cell(file.trailer.childCount),
                    cell(file.trailer.recordCount)
                };
                out.push_back(std::move(row));
            }
        }
    }
    return out;
}

// ----------------------- CSV I/O ------------------

// Writes the display values. Returns the number of data rows (header excluded).
inline std::size_t write_csv(const ExportData& rows, std::ostream& os, const ExportOptions& opt = {}, bool hasTitle = false) {
    if (opt.write_utf8_bom) {
        const unsigned char bom[3] = {0xEF,0xBB,0xBF};
        os.write(reinterpret_cast<const char*>(bom), 3);
    }
    const char D = opt.delimiter;
    for (const auto& row : rows) {
        for (size_t i = 0; i < row.size(); ++i) {
            os << csv_escape(row[i].first, D);
            if (i + 1 < row.size()) os << D;
        }
        os << "\n";
    }
    if (hasTitle && !rows.empty()) return rows.size() - 1;
    return rows.size();
}

// RFC-4180 reader. Cells land in .first, .second stays empty.
// Returns false on a read error or an unterminated quoted field.
inline bool read_csv(std::istream& is, char delimiter, ExportData& out) {
    std::string content{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
    if (is.bad()) return false;
    std::string_view s = content;
    if (s.substr(0, 3) == "\xEF\xBB\xBF") s.remove_prefix(3);

    ExportRow row;
    std::string field;
    bool inQuotes = false;
    bool rowHasData = false;

    auto end_field = [&]() {
        row.emplace_back(std::move(field), "");
        field.clear();
    };
    auto end_row = [&]() {
        end_field();
        if (rowHasData || row.size() > 1 || !row.front().first.empty())
            out.push_back(std::move(row));
        row.clear();
        rowHasData = false;
    };

    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (inQuotes) {
            if (c == '"') {
                if (i + 1 < s.size() && s[i + 1] == '"') { field.push_back('"'); ++i; }
                else inQuotes = false;
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"') { inQuotes = true; rowHasData = true; }
        else if (c == delimiter) end_field();
        else if (c == '\r') { /* part of CRLF */ }
        else if (c == '\n') end_row();
        else field.push_back(c);
    }
    if (inQuotes) return false;
    if (!field.empty() || !row.empty() || rowHasData) end_row();
    return true;
}

} // namespace bai2
