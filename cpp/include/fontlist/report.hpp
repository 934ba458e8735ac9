// ==============================================================================
// fontlist/report.hpp - Представление результатов
// ==============================================================================
//
// Назначение:
// - FontRecord -> таблица / CSV / JSON / JSON Lines
// - Заголовки и ключи: Name, Path, Scope
//
// ==============================================================================

#ifndef FONTLIST_REPORT_HPP
#define FONTLIST_REPORT_HPP

#include "fontlist/lister.hpp"
#include "fontlist/output.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace fontlist::report {

/// Таблица с Unicode box-drawing. Пустой список -> пустая строка.
std::string render_table(const std::vector<FontRecord>& fonts);

/// CSV с заголовком "Name,Path,Scope" (CRLF не используется)
std::string render_csv(const std::vector<FontRecord>& fonts);

/// JSON массив с отступом в 2 пробела и завершающим переводом строки
std::string render_json(const std::vector<FontRecord>& fonts);

/// Один компактный JSON объект на строку
std::string render_jsonl(const std::vector<FontRecord>& fonts);

/// Выбор представления по формату
std::string render(const std::vector<FontRecord>& fonts, output::Format format);

/// Экранирование поля CSV (RFC 4180)
std::string csv_escape(std::string_view field);

}  // namespace fontlist::report

#endif  // FONTLIST_REPORT_HPP
