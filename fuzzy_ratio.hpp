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
#include <algorithm>
#include <cctype>
#include <iterator>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#ifdef USE_UTF8PROC
#include <utf8proc.h>
#include <cstdlib>
#include <memory>
#endif

namespace bai2 {

#ifdef USE_UTF8PROC

    // RAII deleter for buffers allocated by utf8proc_map (uses malloc internally)
    struct Utf8ProcDeleter {
        void operator()(utf8proc_uint8_t* p) const noexcept { if (p) std::free(p); }
    };

    // Check if codepoint is considered whitespace (Unicode separators + ASCII controls)
    inline bool isUnicodeSpaceOrControlWS(utf8proc_int32_t cp) {
        const int cat = utf8proc_category(cp);
        if (cat == UTF8PROC_CATEGORY_ZS ||
            cat == UTF8PROC_CATEGORY_ZL ||
            cat == UTF8PROC_CATEGORY_ZP) {
            return true;
        }
        switch (cp) {
        case 0x09: // \t
        case 0x0A: // \n
        case 0x0B: // \v
        case 0x0C: // \f
        case 0x0D: // \r
            return true;
        default:
            return false;
        }
    }

    // NFC + casefold; every kind of whitespace becomes a single ASCII blank,
    // zero-width characters are dropped. Word boundaries survive.
    inline std::string casefold_text(std::string_view in)
    {
        utf8proc_uint8_t* raw = nullptr;
        const utf8proc_option_t opts = (utf8proc_option_t)(UTF8PROC_COMPOSE | UTF8PROC_CASEFOLD);

        const utf8proc_ssize_t nlen = utf8proc_map(
            reinterpret_cast<const utf8proc_uint8_t*>(in.data()),
            static_cast<utf8proc_ssize_t>(in.size()),
            &raw, opts
        );
        if (nlen < 0 || !raw) {
            return std::string(in); // Fallback: return original input
        }
        std::unique_ptr<utf8proc_uint8_t, Utf8ProcDeleter> norm(raw);

        std::string out;
        out.reserve(static_cast<size_t>(nlen));
        const utf8proc_uint8_t* p   = norm.get();
        const utf8proc_uint8_t* end = norm.get() + nlen;

        while (p < end) {
            utf8proc_int32_t cp = 0;
            const utf8proc_ssize_t adv =
                utf8proc_iterate(p, (utf8proc_ssize_t)(end - p), &cp);
            if (adv <= 0) { // Skip invalid byte
                ++p;
                continue;
            }
            p += adv;

            if (isUnicodeSpaceOrControlWS(cp)) {
                out.push_back(' ');
                continue;
            }
            switch (cp) {
            case 0x200B: // ZERO WIDTH SPACE
            case 0x200C: // ZERO WIDTH NON-JOINER
            case 0x200D: // ZERO WIDTH JOINER
            case 0x2060: // WORD JOINER
            case 0xFEFF: // BOM / ZERO WIDTH NO-BREAK SPACE
                continue;
            }

            utf8proc_uint8_t buf[4];
            const utf8proc_ssize_t w = utf8proc_encode_char(cp, buf);
            if (w > 0) {
                out.append(reinterpret_cast<char*>(buf), (size_t)w);
            }
        }

        return out;
    }

#else // USE_UTF8PROC not defined

    // Minimal ASCII-only fallback:
    // - maps ASCII whitespace to ' '
    // - lowercases A-Z
    // - leaves all non-ASCII bytes untouched
    inline std::string casefold_text(std::string_view in) {
        std::string out;
        out.reserve(in.size());
        for (unsigned char c : in) {
            if (c=='\t' || c=='\n' || c=='\r' || c=='\f' || c=='\v') {
                out.push_back(' ');
            } else if (c < 0x80) {
                out.push_back(static_cast<char>(std::tolower(c)));
            } else {
                out.push_back(static_cast<char>(c)); // keep UTF-8 byte
            }
        }
        return out;
    }

#endif // USE_UTF8PROC

// sorted, de-duplicated words
inline std::vector<std::string> token_set(std::string_view s) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < s.size()) {
        while (i < s.size() && s[i] == ' ') ++i;
        size_t start = i;
        while (i < s.size() && s[i] != ' ') ++i;
        if (i > start) tokens.emplace_back(s.substr(start, i - start));
    }
    std::sort(tokens.begin(), tokens.end());
    tokens.erase(std::unique(tokens.begin(), tokens.end()), tokens.end());
    return tokens;
}

inline std::string join_tokens(const std::vector<std::string>& tokens) {
    std::string out;
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) out.push_back(' ');
        out += tokens[i];
    }
    return out;
}

inline size_t lcs_length(std::string_view a, std::string_view b) {
    if (a.size() < b.size()) std::swap(a, b);
    std::vector<size_t> row(b.size() + 1, 0);
    for (size_t i = 1; i <= a.size(); ++i) {
        size_t diag = 0;
        for (size_t j = 1; j <= b.size(); ++j) {
            const size_t up = row[j];
            row[j] = (a[i-1] == b[j-1]) ? diag + 1 : std::max(row[j], row[j-1]);
            diag = up;
        }
    }
    return row[b.size()];
}

// Normalized indel similarity 0..100 (insertions/deletions only, no substitutions)
inline double indel_ratio(std::string_view a, std::string_view b) {
    const size_t total = a.size() + b.size();
    if (total == 0) return 100.0;
    return 100.0 * static_cast<double>(2 * lcs_length(a, b)) / static_cast<double>(total);
}

// Word-order independent similarity 0..100.
// Compares the shared words against each side's shared+own words; a name that
// is fully contained in the other text scores 100. Input is compared as given,
// callers fold case first.
inline double token_set_ratio(std::string_view a, std::string_view b) {
    const auto ta = token_set(a);
    const auto tb = token_set(b);
    if (ta.empty() || tb.empty()) return 0.0;

    std::vector<std::string> sect, diffAB, diffBA;
    std::set_intersection(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(sect));
    std::set_difference(ta.begin(), ta.end(), tb.begin(), tb.end(), std::back_inserter(diffAB));
    std::set_difference(tb.begin(), tb.end(), ta.begin(), ta.end(), std::back_inserter(diffBA));

    if (!sect.empty() && (diffAB.empty() || diffBA.empty())) return 100.0;

    const std::string s  = join_tokens(sect);
    const std::string ab = join_tokens(diffAB);
    const std::string ba = join_tokens(diffBA);
    const std::string sectAB = s.empty() ? ab : s + " " + ab;
    const std::string sectBA = s.empty() ? ba : s + " " + ba;

    double best = indel_ratio(sectAB, sectBA);
    if (s.empty()) return best;
    best = std::max(best, indel_ratio(s, sectAB));
    best = std::max(best, indel_ratio(s, sectBA));
    return best;
}

// case-insensitive variant used for memo/customer comparison
inline double name_similarity(std::string_view a, std::string_view b) {
    return token_set_ratio(casefold_text(a), casefold_text(b));
}

} // namespace bai2
