#include "ExternalSorter.hpp"
#include "ChunkSorter.hpp"
#include "Errors.hpp"
#include "Merger.hpp"
#include "Splitter.hpp"
#include "Table.hpp"
#include "Workspace.hpp"
#include <spdlog/spdlog.h>
#include <optional>
#include <system_error>

namespace csvsort {

namespace {
/* Segue links simbólicos até o arquivo real (que pode ainda não existir). */
std::filesystem::path resolveDestination(const std::filesystem::path& dest)
{
    auto target = dest;
    for (int hops = 0; hops < 40; ++hops) {
        std::error_code ec;
        if (!std::filesystem::is_symlink(target, ec)) return target;
        auto link = std::filesystem::read_symlink(target, ec);
        if (ec) throw IoFailure(target, "output", "link ilegível: " + ec.message());
        target = link.is_absolute() ? link : target.parent_path() / link;
    }
    throw IoFailure(dest, "output", "links simbólicos demais");
}

/* ----------- grava o destino via arquivo parcial + rename ----------------
 *  O arquivo parcial fica ao lado do arquivo real; se o destino já existe,
 *  recebe as permissões dele antes do rename.                              */
void writeOutput(const std::filesystem::path&                dest,
                 const std::optional<Row>&                   header,
                 const std::optional<std::filesystem::path>& sorted,
                 const Dialect&                              dialect,
                 IoTracker*                                  io)
{
    const auto target = resolveDestination(dest);
    auto partial = target;
    partial += ".csvsort-partial";

    try {
        RowWriter out(partial, dialect, "output", io);
        if (header) out.write(*header);
        if (sorted) {
            RowReader in(*sorted, INTERNAL_DIALECT.delimiter, "output", io);
            Row row;
            while (in.next(row)) out.write(row);
        }
        out.close();

        std::error_code ec;
        const auto st = std::filesystem::status(target, ec);
        if (!ec && std::filesystem::exists(st)) {
            std::filesystem::permissions(partial, st.permissions(),
                                         std::filesystem::perm_options::replace, ec);
            if (ec) throw IoFailure(partial, "output", "não foi possível copiar permissões: " + ec.message());
        }

        std::filesystem::rename(partial, target, ec);
        if (ec) throw IoFailure(target, "output", "não foi possível substituir: " + ec.message());
    } catch (...) {
        std::error_code ec;
        std::filesystem::remove(partial, ec);
        throw;
    }
}
} // anonymous namespace

/* ------------------------- driver externo -------------------------------- */
SortStats externalSort(const std::filesystem::path& input,
                       const SortOptions&           opts)
{
    opts.validate();

    SortStats st;
    st.output = opts.outputPath.empty() ? input : opts.outputPath;

    Workspace ws(opts.tmpDir);

    std::optional<Row> header;
    SortKey key;
    std::vector<std::filesystem::path> chunks;
    {
        Table tbl(input, opts.delimiter, opts.hasHeader, &st.io);
        header = tbl.header();
        key    = resolveColumns(opts.columns, header);

        chunks = splitIntoChunks(tbl.rows(), ws, chunkBytesFromMB(opts.maxChunkSizeMB),
                                 requiredFields(key), &st.io);
        st.rows = tbl.rows().record() - (header ? 1 : 0);
        tbl.close();                        // entrada fechada antes do destino
    }
    st.chunks = chunks.size();
    spdlog::info("Ordenando {} linhas em {} chunks", st.rows, st.chunks);

    sortChunks(chunks, key, opts.threads, &st.io);

    MergeStats ms;
    const auto sorted = mergeAll(std::move(chunks), key, ws, opts.fanIn, &st.io, &ms);
    st.mergePasses = ms.passes;
    st.mergeGroups = ms.groups;

    writeOutput(st.output, header, sorted, Dialect{opts.delimiter, opts.quoting}, &st.io);
    spdlog::info("Resultado gravado em {}", st.output.string());

    ws.remove();
    return st;
}

} // namespace csvsort
