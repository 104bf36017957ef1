#pragma once
#include "RowStream.hpp"
#include "Workspace.hpp"
#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace csvsort {

constexpr std::size_t DEFAULT_FAN_IN = 2;

/* --- Cursor sobre um arquivo ordenado: olha a linha atual, avança ---------*/
class RowCursor {
public:
    explicit RowCursor(const std::filesystem::path& file, IoTracker* io = nullptr);

    bool       valid() const { return valid_; }
    const Row& peek()  const { return head_;  }
    void       advance();

    std::size_t record() const { return in_.record(); }

private:
    RowReader in_;
    Row       head_;
    bool      valid_ = false;
};

struct MergeStats {
    std::size_t passes = 0;   // passes de merge
    std::size_t groups = 0;   // merges de n arquivos executados
};

/* ---------------------------------------------------------------------------
 *  Merge k-way por heap de cursores.  Em empate de chave sai primeiro a
 *  linha do arquivo que vem antes em `inputs`.  Nenhum arquivo é carregado
 *  inteiro: uma linha por cursor.
 * --------------------------------------------------------------------------*/
void mergeGroup(const std::vector<std::filesystem::path>& inputs,
                const std::filesystem::path& output, const SortKey& key,
                IoTracker* io = nullptr);

/* ---------------------------------------------------------------------------
 *  Passes sucessivos de merge de `fanIn` em `fanIn` arquivos até sobrar um.
 *  Cada pass mantém a ordem dos arquivos (um arquivo solitário no fim passa
 *  para o pass seguinte), então o resultado continua estável.  Entradas
 *  consumidas são apagadas na hora.
 *  Nenhum arquivo -> nullopt; um arquivo -> ele mesmo.
 * --------------------------------------------------------------------------*/
std::optional<std::filesystem::path>
mergeAll(std::vector<std::filesystem::path> files, const SortKey& key,
         Workspace& ws, std::size_t fanIn = DEFAULT_FAN_IN,
         IoTracker* io = nullptr, MergeStats* stats = nullptr);

} // namespace csvsort
