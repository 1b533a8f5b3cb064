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
#include <string>

namespace bai2 {

// Open AR invoice as delivered by the invoice service
struct Invoice {
    std::string id;               // internal record id
    std::string number;           // display number (tranid), e.g. "INV-1001"
    std::string customerName;     // company name, else "first last", else entity id
    CurrencyAmount amountRemaining; // unpaid balance, currency "USD" if not reported
    std::string tranDate;
    std::string dueDate;
    std::string url;              // resolved link to the invoice
};

} // namespace bai2
