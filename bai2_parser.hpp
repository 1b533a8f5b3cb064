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
#include <fstream>
#include <istream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bai2 {

enum class ParseErrc {
    None,
    EmptyInput,         // nothing but blank lines
    MissingFileHeader,  // no 01 record: not a BAI2 file
    IoError             // file/stream could not be read
};

struct ParseError {
    ParseErrc code{ParseErrc::None};
    std::string message;
};

// ---------- Helpers (line level) ----------
inline bool is_blank(char ch) { return ch==' ' || ch=='\t' || ch=='\r' || ch=='\n' || ch=='\f' || ch=='\v'; }

inline std::string_view rtrim_view(std::string_view s) {
    while (!s.empty() && is_blank(s.back())) s.remove_suffix(1);
    return s;
}

inline std::string_view trim_view(std::string_view s) {
    while (!s.empty() && is_blank(s.front())) s.remove_prefix(1);
    return rtrim_view(s);
}

inline RecordType record_type(std::string_view tag) {
    tag = trim_view(tag);
    while (!tag.empty() && tag.back()=='/') tag.remove_suffix(1);
    if (tag == "01") return RecordType::FileHeader;
    if (tag == "02") return RecordType::GroupHeader;
    if (tag == "03") return RecordType::AccountHeader;
    if (tag == "16") return RecordType::Transaction;
    if (tag == "49") return RecordType::AccountTrailer;
    if (tag == "88") return RecordType::Continuation;
    if (tag == "98") return RecordType::GroupTrailer;
    if (tag == "99") return RecordType::FileTrailer;
    return RecordType::Unknown;
}

// first comma-separated field of a physical line
inline std::string_view record_tag(std::string_view line) {
    const size_t p = line.find(',');
    return p == std::string_view::npos ? line : line.substr(0, p);
}

// Physical lines without line endings; blank lines are dropped.
// Trailing blanks stay: they may belong to text continued on the next line.
inline std::vector<std::string> split_lines(std::string_view content) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= content.size()) {
        size_t pos = content.find('\n', start);
        std::string_view line = (pos == std::string_view::npos)
            ? content.substr(start)
            : content.substr(start, pos - start);
        if (!line.empty() && line.back()=='\r') line.remove_suffix(1);
        if (!trim_view(line).empty())
            lines.emplace_back(line);
        if (pos == std::string_view::npos) break;
        start = pos + 1;
    }
    return lines;
}

// Merge 88 records into the logical record before them.
// The terminator of the preceding record (with any padding after it) is
// dropped, the payload after "88," is appended as-is, so a chain of
// continuations rebuilds the original text.
inline std::vector<std::string> join_continuations(const std::vector<std::string>& lines) {
    std::vector<std::string> merged;
    merged.reserve(lines.size());
    for (const auto& line : lines) {
        if (record_type(record_tag(line)) == RecordType::Continuation && !merged.empty()) {
            std::string& prev = merged.back();
            const std::string_view body = rtrim_view(prev);
            if (!body.empty() && body.back()=='/') {
                prev.resize(body.size());
                while (!prev.empty() && prev.back()=='/') prev.pop_back();
            }
            const size_t p = line.find(',');
            if (p != std::string::npos)
                prev.append(line, p + 1, std::string::npos);
        } else {
            merged.push_back(line);
        }
    }
    return merged;
}

// "16,165,150000,0,,,ACME/" -> {"16","165","150000","0","","","ACME"}
inline std::vector<std::string> split_fields(std::string_view line) {
    line = rtrim_view(line);
    while (!line.empty() && line.back()=='/') line.remove_suffix(1);
    while (!line.empty() && line.back()==',') line.remove_suffix(1);

    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = line.find(',', start);
        if (pos == std::string_view::npos) {
            out.emplace_back(line.substr(start));
            break;
        }
        out.emplace_back(line.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

// Positional access to the fields of one logical record.
// Missing positions never fail: they yield the supplied default.
class FieldReader {
public:
    explicit FieldReader(std::vector<std::string> fields) : fields_(std::move(fields)) {}

    std::size_t size() const { return fields_.size(); }

    std::string at(std::size_t i, std::string_view def = {}) const {
        return i < fields_.size() ? fields_[i] : std::string(def);
    }

    // fields i..end joined back with the separator (free text may contain commas)
    std::string join_from(std::size_t i, char sep = ',') const {
        std::string out;
        for (std::size_t k = i; k < fields_.size(); ++k) {
            if (k > i) out.push_back(sep);
            out += fields_[k];
        }
        return out;
    }

    RecordType type() const { return record_type(at(0)); }

private:
    std::vector<std::string> fields_;
};

// ---------- Record builders ----------
inline void read_file_header(const FieldReader& f, File& out) {
    out.senderId        = f.at(1);
    out.receiverId      = f.at(2);
    out.creationDate    = f.at(3);
    out.creationTime    = f.at(4);
    out.resendIndicator = f.at(5);
    out.recordSize      = f.at(6);
    out.blockingFactor  = f.at(7);
    out.version         = f.at(8);
}

inline Group parse_group_header(const FieldReader& f) {
    Group g;
    g.ultimateReceiverId = f.at(1);
    g.originatorId       = f.at(2);
    g.status             = f.at(3);
    g.asOfDate           = f.at(4);
    g.asOfTime           = f.at(5);
    g.currency           = f.at(6);
    g.asOfDateModifier   = f.at(7);
    return g;
}

// 03,account,currency[,typeCode,amount,itemCount,fundsType]...
inline Account parse_account_header(const FieldReader& f) {
    Account a;
    a.customerAccount = f.at(1);
    a.currency        = f.at(2);
    for (std::size_t i = 3; i < f.size(); i += 4) {
        BalanceEntry b;
        b.typeCode  = f.at(i);
        b.amount    = f.at(i + 1);
        b.itemCount = f.at(i + 2);
        b.fundsType = f.at(i + 3);
        if (b.typeCode.empty()) continue;
        a.balances.push_back(std::move(b));
    }
    return a;
}

inline Transaction parse_transaction(const FieldReader& f) {
    Transaction t;
    t.typeCode    = f.at(1);
    t.amount      = f.at(2);
    t.fundsType   = f.at(3);
    t.bankRef     = f.at(4);
    t.customerRef = f.at(5);
    t.text        = f.join_from(6);
    return t;
}

// 49,total,records / 98,total,accounts,records / 99,total,groups,records
inline Trailer parse_trailer(const FieldReader& f) {
    Trailer t;
    t.controlTotal = f.at(1);
    if (f.type() == RecordType::AccountTrailer) {
        t.recordCount = f.at(2);
    } else {
        t.childCount  = f.at(2);
        t.recordCount = f.at(3);
    }
    t.hasTrailer = true;
    return t;
}

inline TransactionContext make_context(const File& file, const Group& g, const Account& a) {
    TransactionContext c;
    c.accountId        = a.customerAccount;
    c.currency         = a.currency.empty() ? g.currency : a.currency;
    c.asOfDate         = g.asOfDate;
    c.asOfTime         = g.asOfTime;
    c.asOfDateModifier = g.asOfDateModifier;
    c.bankId           = g.originatorId;
    c.customerId       = g.ultimateReceiverId;
    c.fileDate         = file.creationDate;
    c.fileTime         = file.creationTime;
    return c;
}

// Currently open level per record type. A trailer closes its own level and
// everything below it; a new group header closes a dangling account.
struct ParseState {
    std::optional<std::size_t> group;     // index into File::groups
    std::optional<std::size_t> account;   // index into the group's accounts or File::orphanAccounts
    bool accountIsOrphan{false};

    Account* current_account(File& f) const {
        if (!account) return nullptr;
        if (accountIsOrphan) return &f.orphanAccounts[*account];
        return &f.groups[*group].accounts[*account];
    }

    void close_account() { account.reset(); accountIsOrphan = false; }
    void close_group()   { close_account(); group.reset(); }
};

inline void set_error(ParseError* error, ParseErrc code, const char* message) {
    if (!error) return;
    error->code = code;
    error->message = message;
}

// ---------- Parser-Class ----------
class Parser {
public:

    bool parse_file(const std::string& path, File& out, ParseError* error=nullptr) const {
        std::ifstream in(path, std::ios::in | std::ios::binary);
        if (!in) { set_error(error, ParseErrc::IoError, "Cannot open BAI2 file"); return false; }
        return parse_file(in, out, error);
    }

    bool parse_file(std::istream& is, File& out, ParseError* error=nullptr) const {
        std::string content{std::istreambuf_iterator<char>(is), std::istreambuf_iterator<char>()};
        if (is.bad()) { set_error(error, ParseErrc::IoError, "BAI2 stream read error"); return false; }
        return parse_string(content, out, error);
    }

    // On failure `out` is left untouched.
    bool parse_string(std::string_view content, File& out, ParseError* error=nullptr) const {
        if (content.substr(0, 3) == "\xEF\xBB\xBF") content.remove_prefix(3);

        const std::vector<std::string> records = join_continuations(split_lines(content));
        if (records.empty()) { set_error(error, ParseErrc::EmptyInput, "Empty BAI2 content"); return false; }

        File file;
        ParseState st;
        bool sawFileHeader = false;

        for (const auto& rec : records) {
            const FieldReader f(split_fields(rec));

            switch (f.type()) {
            case RecordType::FileHeader:
                read_file_header(f, file);
                sawFileHeader = true;
                break;

            case RecordType::GroupHeader:
                file.groups.push_back(parse_group_header(f));
                st.close_account();
                st.group = file.groups.size() - 1;
                break;

            case RecordType::AccountHeader: {
                Account a = parse_account_header(f);
                if (st.group) {
                    auto& accounts = file.groups[*st.group].accounts;
                    accounts.push_back(std::move(a));
                    st.account = accounts.size() - 1;
                    st.accountIsOrphan = false;
                } else {
                    file.orphanAccounts.push_back(std::move(a));
                    st.account = file.orphanAccounts.size() - 1;
                    st.accountIsOrphan = true;
                }
                break;
            }

            case RecordType::Transaction: {
                Transaction t = parse_transaction(f);
                Account* acct = st.current_account(file);
                if (acct && st.group)
                    t.context = make_context(file, file.groups[*st.group], *acct);
                if (acct)
                    acct->transactions.push_back(std::move(t));
                else
                    file.orphanTransactions.push_back(std::move(t));
                break;
            }

            case RecordType::AccountTrailer:
                if (Account* acct = st.current_account(file))
                    acct->trailer = parse_trailer(f);
                st.close_account();
                break;

            case RecordType::GroupTrailer:
                if (st.group)
                    file.groups[*st.group].trailer = parse_trailer(f);
                st.close_group();
                break;

            case RecordType::FileTrailer:
                file.trailer = parse_trailer(f);
                st.close_group();
                break;

            case RecordType::Continuation: // leading 88 without a record to extend
            case RecordType::Unknown:
                break;
            }
        }

        if (!sawFileHeader) { set_error(error, ParseErrc::MissingFileHeader, "No BAI2 file header (01) found"); return false; }

        out = std::move(file);
        return true;
    }
};

} // namespace bai2
