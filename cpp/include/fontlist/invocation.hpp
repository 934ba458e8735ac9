// ==============================================================================
// fontlist/invocation.hpp - Сборка запроса из командной строки и конфигурации
// ==============================================================================
//
// Назначение:
// - Шаблоны имён из stdin (позиционный аргумент "-")
// - Слияние ListCommand и Config: конфигурация заполняет только то,
//   о чём командная строка молчит
// - Текст диагностики для прерванного обхода
//
// ==============================================================================

#ifndef FONTLIST_INVOCATION_HPP
#define FONTLIST_INVOCATION_HPP

#include "fontlist/cli.hpp"
#include "fontlist/config.hpp"
#include "fontlist/lister.hpp"
#include "fontlist/output.hpp"

#include <istream>
#include <optional>
#include <string>

namespace fontlist::app {

struct Invocation {
    ListOptions options;
    output::Format format = output::Format::Std;
};

/// Шаблоны по одному на строку. Пустые строки пропускаются, завершающий
/// '\r' отбрасывается.
void read_names(std::istream& in, ListRequest& request);

/// Собрать параметры перечисления.
///
/// Шаблоны из stdin вставляются на место первого "-"; повторные "-"
/// игнорируются. Если в итоге шаблонов нет, берутся names из config, затем "*".
/// skip_errors включается, если его задал хотя бы один источник.
Invocation build_invocation(const cli::ListCommand& cmd, const config::Config& cfg,
                            std::istream& in);

/// "font directory for <scope> does not exist - <path>" если обход прерван
std::optional<std::string> missing_directory_message(const ListResult& result);

}  // namespace fontlist::app

#endif  // FONTLIST_INVOCATION_HPP
