#pragma once
#include "Row.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace csvsort {

/* Coluna pedida pelo usuário: posição (base 0) ou nome no cabeçalho. */
using ColumnSpec = std::variant<std::size_t, std::string>;

/* Texto só de dígitos vira índice; qualquer outro vira nome. */
ColumnSpec  parseColumnSpec(const std::string& text);
std::string toString(const ColumnSpec& spec);

/* ---------------------------------------------------------------------------
 *  Converte os especificadores em índices, na mesma ordem (primeiro = chave
 *  primária).  Sem cabeçalho, índices são aceitos como vieram.
 *  Lança ColumnOutOfRange, ColumnNotFound ou MissingHeader.
 * --------------------------------------------------------------------------*/
SortKey resolveColumns(const std::vector<ColumnSpec>& specs,
                       const std::optional<Row>& header);

} // namespace csvsort
