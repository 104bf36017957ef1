#pragma once
#include "RowStream.hpp"
#include "Workspace.hpp"
#include <cstdint>
#include <filesystem>
#include <vector>

namespace csvsort {

/* MB (aceita fração) -> bytes. */
std::uint64_t chunkBytesFromMB(double megabytes);

/* ---------------------------------------------------------------------------
 *  Consome `rows` uma única vez e grava as linhas, na ordem de entrada, em
 *  chunks do workspace.  Limite flexível: o chunk é selado logo depois da
 *  linha que fez a estimativa passar de `maxChunkBytes`.
 *  Toda linha precisa de `keyFields` campos (MalformedRow).
 *  Sem linhas -> lista vazia.
 * --------------------------------------------------------------------------*/
std::vector<std::filesystem::path>
splitIntoChunks(RowReader& rows, Workspace& ws, std::uint64_t maxChunkBytes,
                std::size_t keyFields, IoTracker* io = nullptr);

} // namespace csvsort
