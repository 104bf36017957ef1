#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace csvsort {

constexpr std::size_t FIELD_OVERHEAD_BYTES = 32;   // custo fixo por campo
constexpr std::size_t ROW_OVERHEAD_BYTES   = 24;   // custo fixo por linha
constexpr std::size_t BYTES_POR_MB         = 1024 * 1024;

/* ---------------- estrutura de uma linha -----------------------------------*/
struct Row {
    std::vector<std::string> cols;
};

/* Índices das colunas da chave, em ordem de precedência. */
using SortKey = std::vector<std::size_t>;

/* Estimativa determinística do tamanho de uma linha em memória. */
std::size_t estimateRowBytes(const Row& row);

/* Menor número de campos que uma linha precisa ter para a chave. */
std::size_t requiredFields(const SortKey& key);

/* Lança MalformedRow se `row` não tem todos os campos da chave. */
void requireKeyFields(const Row& row, std::size_t needed,
                      const std::filesystem::path& file, std::size_t record);

/* ---------------- comparação pela chave ------------------------------------
 *  Compara os campos da chave um a um, como texto opaco (byte a byte,
 *  sensível a maiúsculas).  Supõe que requireKeyFields já passou.
 * --------------------------------------------------------------------------*/
class KeyLess {
public:
    explicit KeyLess(const SortKey& key) : key_(&key) {}

    bool operator()(const Row& a, const Row& b) const
    {
        for (std::size_t idx : *key_) {
            const int c = a.cols[idx].compare(b.cols[idx]);
            if (c != 0) return c < 0;
        }
        return false;
    }

private:
    const SortKey* key_;
};

} // namespace csvsort
