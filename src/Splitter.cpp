#include "Splitter.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <limits>
#include <memory>

namespace csvsort {

std::uint64_t chunkBytesFromMB(double megabytes)
{
    if (!(megabytes >= 0.0))
        throw ConfigError("Tamanho de chunk inválido: " + std::to_string(megabytes));
    const double bytes = std::floor(megabytes * static_cast<double>(BYTES_POR_MB));
    if (bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max()))
        return std::numeric_limits<std::uint64_t>::max();
    return static_cast<std::uint64_t>(bytes);
}

std::vector<std::filesystem::path>
splitIntoChunks(RowReader& rows, Workspace& ws, std::uint64_t maxChunkBytes,
                std::size_t keyFields, IoTracker* io)
{
    std::vector<std::filesystem::path> chunks;
    std::unique_ptr<RowWriter> out;
    std::uint64_t current = 0;

    Row row;
    while (rows.next(row)) {
        requireKeyFields(row, keyFields, rows.path(), rows.record());

        if (!out) {
            out = std::make_unique<RowWriter>(ws.newChunkPath(), INTERNAL_DIALECT,
                                              "split", io);
            chunks.push_back(out->path());
        }
        out->write(row);

        current += estimateRowBytes(row);
        if (current > maxChunkBytes) {            // sela o chunk
            out->close();
            spdlog::debug("chunk {} selado: {} linhas", out->path().string(), out->rows());
            out.reset();
            current = 0;
        }
    }
    if (out) {
        out->close();
        spdlog::debug("chunk {} selado: {} linhas", out->path().string(), out->rows());
    }
    return chunks;
}

} // namespace csvsort
