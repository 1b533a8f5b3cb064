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
#include <vector>
#include <cstdint>
#include <unordered_map>

namespace bai2 {

// --- Basis ---
struct CurrencyAmount {
    std::string currency;     // "USD"
    std::int64_t minor{0};    // Minor units (Cent e.g.)
};

// ISO-4217 exponents (short list)
inline int ccy_exp(const std::string& ccy){
    static const std::unordered_map<std::string,int> m{
        {"JPY",0},{"KRW",0},{"VND",0},
        {"BHD",3},{"KWD",3},{"OMR",3},{"TND",3},
        {"CLF",4}
    };
    auto it = m.find(ccy);
    return (it==m.end()) ? 2 : it->second;
}

inline double to_major(const CurrencyAmount& a) {
    double scale = 1.0;
    for (int i = 0; i < ccy_exp(a.currency); ++i) scale *= 10.0;
    return static_cast<double>(a.minor) / scale;
}

// Record type tags (first field of every line)
enum class RecordType {
    FileHeader,      // 01
    GroupHeader,     // 02
    AccountHeader,   // 03
    Transaction,     // 16
    AccountTrailer,  // 49
    Continuation,    // 88
    GroupTrailer,    // 98
    FileTrailer,     // 99
    Unknown
};

// Status/summary quadruple of an 03 record
struct BalanceEntry {
    std::string typeCode;     // e.g. "010" opening ledger, "015" closing ledger
    std::string amount;       // minor units as reported, may be empty
    std::string itemCount;
    std::string fundsType;
};

// Ancestor values copied onto a transaction when it is created
struct TransactionContext {
    std::string accountId;        // 03 customer account
    std::string currency;         // account currency, else group currency
    std::string asOfDate;         // 02 as-of date (YYMMDD)
    std::string asOfTime;
    std::string asOfDateModifier;
    std::string bankId;           // 02 originator
    std::string customerId;       // 02 ultimate receiver
    std::string fileDate;         // 01 creation date
    std::string fileTime;
};

// Transaction detail (16)
struct Transaction {
    std::string typeCode;
    std::string amount;           // minor units, integer string
    std::string fundsType;
    std::string bankRef;
    std::string customerRef;
    std::string text;             // free text incl. joined 88 continuations
    TransactionContext context;   // empty if no account/group was open
};

// Trailer values (49 / 98 / 99)
struct Trailer {
    std::string controlTotal;
    std::string childCount;       // 98: number of accounts, 99: number of groups
    std::string recordCount;
    bool hasTrailer{false};       // true once the trailer record was seen
};

// Account identifier + balances (03), closed by 49
struct Account {
    std::string customerAccount;
    std::string currency;
    std::vector<BalanceEntry> balances;
    std::vector<Transaction> transactions;
    Trailer trailer;
};

// Group header (02), closed by 98
struct Group {
    std::string ultimateReceiverId;
    std::string originatorId;
    std::string status;           // 1 update, 2 deletion, 3 correction, 4 test only
    std::string asOfDate;
    std::string asOfTime;
    std::string currency;
    std::string asOfDateModifier;
    std::vector<Account> accounts;
    Trailer trailer;
};

// File header (01), closed by 99
struct File {
    std::string senderId;
    std::string receiverId;
    std::string creationDate;
    std::string creationTime;
    std::string resendIndicator;
    std::string recordSize;
    std::string blockingFactor;
    std::string version;
    std::vector<Group> groups;
    Trailer trailer;

    // Records that arrived while their parent level was closed
    std::vector<Account> orphanAccounts;         // 03 without an open 02
    std::vector<Transaction> orphanTransactions; // 16 without an open 03
};

} // namespace bai2
