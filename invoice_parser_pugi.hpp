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
#include "invoice_model.hpp"
#include <pugixml.hpp>
#include <algorithm>
#include <charconv>
#include <cstdint>
#include <cstring>
#include <istream>
#include <string>
#include <vector>

namespace bai2 {

// ---------- Helpers (namespace-agnostic, only classic loops) ----------
inline const char* ln(const pugi::xml_node& n) {
    if (!n) return "";
    const char* full = n.name();
    const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_node& n, const char* wanted) { return std::strcmp(ln(n), wanted) == 0; }

inline const char* ln(const pugi::xml_attribute& a) {
    if (!a) return "";
    const char* full = a.name(); const char* c = std::strrchr(full, ':');
    return c ? c + 1 : full;
}
inline bool isln(const pugi::xml_attribute& a, const char* wanted) { return std::strcmp(ln(a), wanted) == 0; }

// direct child with local name
inline pugi::xml_node child_any(const pugi::xml_node& p, const char* name) {
    for (pugi::xml_node c = p.first_child(); c; c = c.next_sibling())
        if (isln(c, name)) return c;
    return pugi::xml_node();
}

inline std::string txt(const pugi::xml_node& n) {
    std::string s = n.text().as_string(); // UTF-8
    // trim
    auto notsp = [](int ch){ return ch!=' ' && ch!='\t' && ch!='\n' && ch!='\r'; };
    s.erase(s.begin(), std::find_if(s.begin(), s.end(), notsp));
    s.erase(std::find_if(s.rbegin(), s.rend(), notsp).base(), s.end());
    return s;
}
inline std::string child_text(const pugi::xml_node& p, const char* name) {
    pugi::xml_node n = child_any(p, name);
    return n ? txt(n) : std::string();
}

inline std::string attr_text(const pugi::xml_node& n, const char* name) {
    for (pugi::xml_attribute at = n.first_attribute(); at; at = at.next_attribute())
        if (isln(at, name)) return at.value();
    return std::string();
}

// "1,234.56" / "1.234,56" / "1234.5" -> minor units. Unparseable or
// out-of-range text yields 0 (exception-free).
inline std::int64_t dec_to_minor(std::string s, int exp) {
    s.erase(std::remove_if(s.begin(), s.end(), [](unsigned char ch){
        return ch==' '||ch=='\t'||ch=='\r'||ch=='\n'||ch=='\''||ch=='_';
    }), s.end());

    bool neg = false;
    if (!s.empty() && (s.front()=='+' || s.front()=='-')) {
        neg = s.front()=='-';
        s.erase(s.begin());
    }

    // the right-most of '.' and ',' is the decimal separator, the other one groups
    const size_t lastDot = s.find_last_of('.');
    const size_t lastCom = s.find_last_of(',');
    size_t decPos = std::string::npos;
    if (lastDot != std::string::npos && lastCom != std::string::npos) decPos = std::max(lastDot, lastCom);
    else if (lastDot != std::string::npos) decPos = lastDot;
    else if (lastCom != std::string::npos) decPos = lastCom;

    std::string intp = s.substr(0, decPos);
    std::string frac = decPos == std::string::npos ? std::string() : s.substr(decPos + 1);
    intp.erase(std::remove_if(intp.begin(), intp.end(), [](char ch){ return ch=='.' || ch==','; }), intp.end());

    if (exp < 0) exp = 0;
    if ((int)frac.size() > exp) frac.resize((size_t)exp);
    else frac.append((size_t)(exp - (int)frac.size()), '0');

    const std::string digits = (intp.empty() ? "0" : intp) + frac;
    for (unsigned char c : digits) if (c < '0' || c > '9') return 0;

    std::int64_t v = 0;
    auto [p, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), v);
    if (ec != std::errc()) return 0;
    return neg ? -v : v;
}

// replaces every "{id}"
inline std::string resolve_invoice_url(std::string templ, const std::string& id) {
    static const std::string kPlaceholder = "{id}";
    for (size_t pos = 0; (pos = templ.find(kPlaceholder, pos)) != std::string::npos; pos += id.size())
        templ.replace(pos, kPlaceholder.size(), id);
    return templ;
}

// CompanyName, else "FirstName LastName", else EntityId
inline std::string invoice_display_name(const pugi::xml_node& inv) {
    std::string name = child_text(inv, "CompanyName");
    if (!name.empty()) return name;

    const std::string first = child_text(inv, "FirstName");
    const std::string last  = child_text(inv, "LastName");
    name = first;
    if (!first.empty() && !last.empty()) name += " ";
    name += last;
    if (!name.empty()) return name;

    return child_text(inv, "EntityId");
}

inline Invoice parse_invoice(const pugi::xml_node& inv, const std::string& urlTemplate) {
    Invoice i;
    i.id           = child_text(inv, "Id");
    i.number       = child_text(inv, "TranId");
    i.customerName = invoice_display_name(inv);

    i.amountRemaining.currency = child_text(inv, "Currency");
    if (i.amountRemaining.currency.empty()) i.amountRemaining.currency = "USD";
    i.amountRemaining.minor = dec_to_minor(child_text(inv, "AmountRemaining"), ccy_exp(i.amountRemaining.currency));

    i.tranDate = child_text(inv, "TranDate");
    i.dueDate  = child_text(inv, "DueDate");

    i.url = child_text(inv, "Url");
    if (i.url.empty() && !urlTemplate.empty())
        i.url = resolve_invoice_url(urlTemplate, i.id);
    return i;
}

// ---------- Reader-Class ----------
class InvoiceReader {
public:

    bool parse_file(const std::string& path, std::vector<Invoice>& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_file(path.c_str(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("Invoice XML file parse error: ") + ok.description(); return false; }
        return parse_doc(doc, out, error);
    }

    bool parse_file(std::istream& is, std::vector<Invoice>& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load(is, pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("Invoice XML parse error: ") + ok.description(); return false; }
        return parse_doc(doc, out, error);
    }

    bool parse_string(const std::string& xml_utf8, std::vector<Invoice>& out, std::string* error=nullptr) const {
        pugi::xml_document doc;
        pugi::xml_parse_result ok = doc.load_buffer(xml_utf8.data(), xml_utf8.size(), pugi::parse_default | pugi::parse_declaration);
        if (!ok){ if(error)*error=std::string("Invoice XML parse error: ") + ok.description(); return false; }
        return parse_doc(doc, out, error);
    }

private:
    bool parse_doc(const pugi::xml_document& doc, std::vector<Invoice>& out, std::string* error) const {
        pugi::xml_node root = doc.document_element();
        if (!root){ if(error)*error="Empty document"; return false; }
        if (!isln(root, "Invoices")){ if(error)*error="Unsupported invoice list root"; return false; }

        const std::string urlTemplate = attr_text(root, "urlTemplate");

        std::vector<Invoice> invoices;
        for (pugi::xml_node n = root.first_child(); n; n = n.next_sibling()){
            if (!isln(n, "Invoice")) continue;
            Invoice inv = parse_invoice(n, urlTemplate);
            if (inv.id.empty() || inv.number.empty()) continue;
            invoices.push_back(std::move(inv));
        }
        out = std::move(invoices);
        return true;
    }
};

} // namespace bai2
