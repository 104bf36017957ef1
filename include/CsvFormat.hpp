#pragma once
#include "Row.hpp"
#include <iosfwd>
#include <string>

namespace csvsort {

/* Política de aspas na escrita (mesmos nomes do módulo csv do Python). */
enum class Quoting { Minimal, All, NonNumeric, None };

Quoting     parseQuoting(const std::string& name);   // lança ConfigError
const char* quotingName(Quoting q);

struct Dialect {
    char    delimiter = ',';
    Quoting quoting   = Quoting::Minimal;
};

/* Formato dos arquivos de chunk/merge, independente do que o usuário pediu. */
constexpr Dialect INTERNAL_DIALECT{};

constexpr char CSV_QUOTE = '"';
constexpr char CSV_EOL   = '\n';

enum class ReadStatus { Ok, End, Unterminated };

/* ---------------------------------------------------------------------------
 *  Lê um registro CSV de `in`.  Campos entre aspas podem conter separador e
 *  quebras de linha; "" dentro de aspas vira ".  Aceita \n, \r\n e \r.
 *  Linhas totalmente vazias são puladas.
 * --------------------------------------------------------------------------*/
ReadStatus readRecord(std::istream& in, char delimiter, Row& out);

/* Serializa `row` (com o terminador) em `out`.  Todo campo é texto, então
 * NonNumeric põe aspas em todos, como All.  Devolve false se a política
 * Quoting::None não consegue representar algum campo. */
bool formatRecord(const Row& row, const Dialect& d, std::string& out);

} // namespace csvsort
