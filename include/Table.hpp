#pragma once
#include "RowStream.hpp"
#include <filesystem>
#include <optional>
#include <string>

namespace csvsort {

/* ========================================================================== *
 *  Representa o CSV de entrada no disco.  NÃO carrega linhas em memória;
 *  separa o cabeçalho (se houver) e expõe o cursor das linhas de dados.
 * ========================================================================== */
class Table {
public:
    Table(std::filesystem::path csvPath, char delimiter, bool hasHeader,
          IoTracker* io = nullptr);

    const std::optional<Row>& header() const { return header_; }

    RowReader& rows()  { return rows_; }
    void       close() { rows_.close(); }

private:
    std::filesystem::path path_;
    RowReader             rows_;
    std::optional<Row>    header_;
};

} // namespace csvsort
