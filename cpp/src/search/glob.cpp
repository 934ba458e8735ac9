// ==============================================================================
// glob.cpp - Wildcard-сопоставление имён файлов
// ==============================================================================

#include "fontlist/glob.hpp"

namespace fontlist::search {

namespace {

// ASCII case folding; остальные кодовые точки сравниваются как есть
char32_t fold(char32_t c) {
    if (c >= U'A' && c <= U'Z') {
        return c + (U'a' - U'A');
    }
    return c;
}

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

}  // namespace

// ----------------------------------------------------------------------------
// UTF-8
// ----------------------------------------------------------------------------

std::u32string decode_utf8(std::string_view text) {
    std::u32string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        auto b0 = static_cast<unsigned char>(text[i]);

        size_t len = 0;
        char32_t cp = 0;
        if (b0 < 0x80) {
            len = 1;
            cp = b0;
        } else if ((b0 & 0xE0) == 0xC0) {
            len = 2;
            cp = b0 & 0x1F;
        } else if ((b0 & 0xF0) == 0xE0) {
            len = 3;
            cp = b0 & 0x0F;
        } else if ((b0 & 0xF8) == 0xF0) {
            len = 4;
            cp = b0 & 0x07;
        }

        bool valid = len > 0 && i + len <= text.size();
        for (size_t k = 1; valid && k < len; ++k) {
            auto b = static_cast<unsigned char>(text[i + k]);
            if (!is_continuation(b)) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (b & 0x3F);
        }

        if (!valid) {
            out.push_back(static_cast<char32_t>(b0));
            ++i;
            continue;
        }

        out.push_back(cp);
        i += len;
    }

    return out;
}

// ----------------------------------------------------------------------------
// GlobPattern
// ----------------------------------------------------------------------------

GlobPattern::GlobPattern(std::string_view pattern) : pattern_(pattern) {
    std::u32string cps = decode_utf8(pattern);

    size_t i = 0;
    while (i < cps.size()) {
        char32_t c = cps[i];

        if (c == U'*') {
            // Несколько "*" подряд эквивалентны одной
            if (tokens_.empty() || tokens_.back().kind != TokenKind::AnyRun) {
                Token t;
                t.kind = TokenKind::AnyRun;
                tokens_.push_back(std::move(t));
            }
            ++i;
            continue;
        }

        if (c == U'?') {
            Token t;
            t.kind = TokenKind::AnyChar;
            tokens_.push_back(std::move(t));
            ++i;
            continue;
        }

        if (c == U'[') {
            Token t;
            t.kind = TokenKind::Class;

            size_t j = i + 1;
            if (j < cps.size() && (cps[j] == U'!' || cps[j] == U'^')) {
                t.negate = true;
                ++j;
            }

            // "]" сразу после "[" или "[!" - обычный символ набора
            bool first = true;
            bool closed = false;
            while (j < cps.size()) {
                if (cps[j] == U']' && !first) {
                    closed = true;
                    break;
                }
                first = false;

                char32_t lo = cps[j];
                char32_t hi = lo;
                if (j + 2 < cps.size() && cps[j + 1] == U'-' && cps[j + 2] != U']') {
                    hi = cps[j + 2];
                    j += 3;
                } else {
                    ++j;
                }
                if (hi < lo) {
                    std::swap(lo, hi);
                }
                t.ranges.emplace_back(lo, hi);
            }

            if (closed) {
                tokens_.push_back(std::move(t));
                i = j + 1;
                continue;
            }
            // Незакрытая "[" - литерал, разбор продолжается со следующего символа
        }

        Token t;
        t.kind = TokenKind::Literal;
        t.ch = fold(c);
        tokens_.push_back(std::move(t));
        ++i;
    }
}

bool GlobPattern::token_matches(const Token& token, char32_t c) {
    switch (token.kind) {
    case TokenKind::Literal:
        return token.ch == fold(c);
    case TokenKind::AnyChar:
        return true;
    case TokenKind::AnyRun:
        return false;
    case TokenKind::Class: {
        char32_t lower = fold(c);
        char32_t upper = (lower >= U'a' && lower <= U'z') ? lower - (U'a' - U'A') : lower;
        bool in_set = false;
        for (const auto& [lo, hi] : token.ranges) {
            if ((lower >= lo && lower <= hi) || (upper >= lo && upper <= hi)) {
                in_set = true;
                break;
            }
        }
        return in_set != token.negate;
    }
    }
    return false;
}

bool GlobPattern::matches(std::string_view text) const {
    std::u32string cps = decode_utf8(text);

    constexpr size_t NONE = static_cast<size_t>(-1);
    size_t t = 0;
    size_t p = 0;
    size_t star = NONE;
    size_t mark = 0;

    while (t < cps.size()) {
        if (p < tokens_.size() && tokens_[p].kind == TokenKind::AnyRun) {
            star = p++;
            mark = t;
            continue;
        }
        if (p < tokens_.size() && token_matches(tokens_[p], cps[t])) {
            ++p;
            ++t;
            continue;
        }
        if (star != NONE) {
            // Откат: "*" поглощает ещё один символ
            p = star + 1;
            t = ++mark;
            continue;
        }
        return false;
    }

    while (p < tokens_.size() && tokens_[p].kind == TokenKind::AnyRun) {
        ++p;
    }
    return p == tokens_.size();
}

}  // namespace fontlist::search
