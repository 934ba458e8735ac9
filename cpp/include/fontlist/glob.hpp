// ==============================================================================
// fontlist/glob.hpp - Wildcard-сопоставление имён файлов
// ==============================================================================
//
// Назначение:
// - Сопоставление отображаемого имени файла (с расширением) с glob-шаблоном
// - Без учёта регистра (ASCII), по кодовым точкам UTF-8
//
// Синтаксис:
//   *        любая последовательность символов (в т.ч. пустая)
//   ?        ровно один символ
//   [abc]    один символ из набора
//   [a-z]    один символ из диапазона
//   [!a-z]   один символ вне набора (также [^a-z])
//   Незакрытая "[" сопоставляется как обычный символ.
//
// ==============================================================================

#ifndef FONTLIST_GLOB_HPP
#define FONTLIST_GLOB_HPP

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace fontlist::search {

class GlobPattern {
public:
    /// Скомпилировать шаблон. Любая строка - корректный шаблон.
    explicit GlobPattern(std::string_view pattern);

    /// Сопоставить всё имя целиком
    bool matches(std::string_view text) const;

    /// Исходная строка шаблона
    const std::string& pattern() const { return pattern_; }

private:
    enum class TokenKind { Literal, AnyChar, AnyRun, Class };

    struct Token {
        TokenKind kind = TokenKind::Literal;
        char32_t ch = 0;
        bool negate = false;
        std::vector<std::pair<char32_t, char32_t>> ranges;
    };

    static bool token_matches(const Token& token, char32_t c);

    std::string pattern_;
    std::vector<Token> tokens_;
};

/// Разбить UTF-8 строку на кодовые точки.
/// Некорректные байты возвращаются как отдельные значения 0x80..0xFF.
std::u32string decode_utf8(std::string_view text);

}  // namespace fontlist::search

#endif  // FONTLIST_GLOB_HPP
