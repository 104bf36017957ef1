#include "ChunkSorter.hpp"
#include "RowStream.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

namespace csvsort {

void sortChunk(const std::filesystem::path& chunk, const SortKey& key,
               IoTracker* io)
{
    const std::size_t needed = requiredFields(key);

    std::vector<Row> mem;
    {
        RowReader in(chunk, INTERNAL_DIALECT.delimiter, "sort", io);
        Row row;
        while (in.next(row)) {
            requireKeyFields(row, needed, chunk, in.record());
            mem.push_back(std::move(row));
        }
    }

    std::stable_sort(mem.begin(), mem.end(), KeyLess(key));

    RowWriter out(chunk, INTERNAL_DIALECT, "sort", io);
    for (const auto& r : mem) out.write(r);
    out.close();
    spdlog::debug("chunk {} ordenado: {} linhas", chunk.string(), mem.size());
}

std::thread startThread(std::function<void()> fn)
{
    return std::thread(std::move(fn));
}

void runWorkers(unsigned n, const std::function<void(unsigned)>& work,
                std::atomic<bool>& stop, const ThreadStarter& start)
{
    std::vector<std::thread> pool;
    pool.reserve(n);
    try {
        for (unsigned t = 0; t < n; ++t)
            pool.push_back(start([&work, t] { work(t); }));
    } catch (...) {
        stop.store(true);
        for (auto& th : pool) th.join();
        throw;
    }
    for (auto& th : pool) th.join();
}

void sortChunks(const std::vector<std::filesystem::path>& chunks,
                const SortKey& key, unsigned threads, IoTracker* io)
{
    if (threads <= 1 || chunks.size() <= 1) {
        for (const auto& c : chunks) sortChunk(c, key, io);
        return;
    }

    /* contadores por thread, somados no fim (IoTracker não é atômico) */
    const unsigned n = std::min<std::size_t>(threads, chunks.size());
    std::vector<IoTracker> local(n);
    std::atomic<std::size_t> nextChunk{0};
    std::atomic<bool> failed{false};
    std::exception_ptr firstError;
    std::mutex errLock;

    auto worker = [&](unsigned tid) {
        for (;;) {
            if (failed.load()) return;
            const std::size_t i = nextChunk.fetch_add(1);
            if (i >= chunks.size()) return;
            try {
                sortChunk(chunks[i], key, io ? &local[tid] : nullptr);
            } catch (...) {
                std::lock_guard<std::mutex> g(errLock);
                if (!firstError) firstError = std::current_exception();
                failed.store(true);
                return;
            }
        }
    };

    runWorkers(n, worker, failed);

    if (io) {
        for (const auto& l : local) {
            io->reads  += l.reads;
            io->writes += l.writes;
            io->files  += l.files;
        }
    }
    if (firstError) std::rethrow_exception(firstError);
}

} // namespace csvsort
