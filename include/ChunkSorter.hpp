#pragma once
#include "IoTracker.hpp"
#include "Row.hpp"
#include <atomic>
#include <filesystem>
#include <functional>
#include <thread>
#include <vector>

namespace csvsort {

/* Carrega o chunk inteiro, ordena de forma estável pela chave e reescreve
 * o mesmo arquivo. */
void sortChunk(const std::filesystem::path& chunk, const SortKey& key,
               IoTracker* io = nullptr);

/* ---------------------------------------------------------------------------
 *  Ordena todos os chunks.  Com threads > 1 cada thread pega o próximo
 *  chunk livre; memória de pico ~ threads * tamanho do chunk.  A primeira
 *  exceção é relançada depois que todas as threads terminam.
 * --------------------------------------------------------------------------*/
void sortChunks(const std::vector<std::filesystem::path>& chunks,
                const SortKey& key, unsigned threads, IoTracker* io = nullptr);

/* Cria uma thread que roda `fn`. */
using ThreadStarter = std::function<std::thread(std::function<void()>)>;

std::thread startThread(std::function<void()> fn);

/* ---------------------------------------------------------------------------
 *  Roda work(tid) em `n` threads e espera todas.  Se criar uma thread falha,
 *  liga `stop`, espera as que já rodam e relança o erro da criação.
 * --------------------------------------------------------------------------*/
void runWorkers(unsigned n, const std::function<void(unsigned)>& work,
                std::atomic<bool>& stop, const ThreadStarter& start = startThread);

} // namespace csvsort
