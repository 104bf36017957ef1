#pragma once
#include "ColumnResolver.hpp"
#include "CsvFormat.hpp"
#include "Merger.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace csvsort {

constexpr double DEFAULT_CHUNK_MB = 100.0;

/* Opções de uma execução; validate() lança ConfigError. */
struct SortOptions {
    std::vector<ColumnSpec> columns;                // obrigatório
    std::filesystem::path   outputPath;             // vazio: sobrescreve a entrada
    double                  maxChunkSizeMB = DEFAULT_CHUNK_MB;
    bool                    hasHeader      = true;
    char                    delimiter      = ',';
    Quoting                 quoting        = Quoting::Minimal;
    std::string             encoding       = "utf-8";
    std::size_t             fanIn          = DEFAULT_FAN_IN;
    unsigned                threads        = 1;
    std::filesystem::path   tmpDir         = ".";

    void validate() const;
};

/* Codificações aceitas são todas transparentes byte a byte. */
bool isSupportedEncoding(const std::string& name);

} // namespace csvsort
