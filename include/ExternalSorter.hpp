#pragma once
#include "IoTracker.hpp"
#include "SortOptions.hpp"
#include <cstddef>
#include <filesystem>

namespace csvsort {

struct SortStats {
    std::size_t           rows        = 0;   // linhas de dados ordenadas
    std::size_t           chunks      = 0;   // chunks gerados no split
    std::size_t           mergePasses = 0;
    std::size_t           mergeGroups = 0;
    IoTracker             io;
    std::filesystem::path output;
};

/* =========================================================================
 *  External Merge Sort de um CSV
 *  – Separa o cabeçalho, resolve as colunas (falha antes de criar chunks)
 *  – Split em chunks de tamanho limitado, ordena cada um em memória
 *  – Passes de merge n-way até sobrar um arquivo
 *  – Grava cabeçalho + linhas no destino (pode ser a própria entrada)
 *  O workspace temporário some em qualquer saída, com sucesso ou erro.
 * =========================================================================*/
SortStats externalSort(const std::filesystem::path& input,
                       const SortOptions&           opts);

} // namespace csvsort
