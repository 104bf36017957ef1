#pragma once
#include "CsvFormat.hpp"
#include "IoTracker.hpp"
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

namespace csvsort {

/* ==========================================================================
 *  Leitura sequencial de linhas de um arquivo CSV (entrada, chunk ou merge).
 *  Só avança; para recomeçar é preciso abrir de novo.  EOF antes do tamanho
 *  visto na abertura é falha de leitura, não fim de arquivo.
 * ==========================================================================*/
class RowReader {
public:
    RowReader(std::filesystem::path path, char delimiter, std::string phase,
              IoTracker* io = nullptr);

    bool next(Row& out);                    // false em EOF
    void close();

    std::size_t                  record() const { return record_; }
    const std::filesystem::path& path()   const { return path_;   }

private:
    std::filesystem::path path_;
    char                  delimiter_;
    std::string           phase_;
    IoTracker*            io_;
    std::ifstream         fin_;
    std::uintmax_t        expected_ = 0;
    bool                  sized_    = false;
    std::size_t           record_   = 0;
};

/* ==========================================================================
 *  Escrita de linhas em um arquivo CSV com o dialeto dado.
 *  close() confirma o flush; o destrutor só fecha.
 * ==========================================================================*/
class RowWriter {
public:
    RowWriter(std::filesystem::path path, const Dialect& dialect,
              std::string phase, IoTracker* io = nullptr);

    void write(const Row& row);
    void close();

    std::size_t                  rows() const { return rows_; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    Dialect               dialect_;
    std::string           phase_;
    IoTracker*            io_;
    std::ofstream         fout_;
    std::string           line_;
    std::size_t           rows_ = 0;
};

} // namespace csvsort
