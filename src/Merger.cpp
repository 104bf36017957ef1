#include "Merger.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <memory>
#include <queue>
#include <system_error>

namespace csvsort {

/* ------------------------------ RowCursor -------------------------------- */
RowCursor::RowCursor(const std::filesystem::path& file, IoTracker* io)
    : in_(file, INTERNAL_DIALECT.delimiter, "merge", io)
{
    advance();
}

void RowCursor::advance()
{
    valid_ = in_.next(head_);
    if (!valid_) in_.close();
}

/* ------------------------- merge de N arquivos ---------------------------- */
namespace {
using Cursors = std::vector<std::unique_ptr<RowCursor>>;

/* ordem do heap: true se `a` deve sair depois de `b` */
struct HeadAfter {
    const Cursors* cur;
    KeyLess        less;

    bool operator()(std::size_t a, std::size_t b) const
    {
        const Row& ra = (*cur)[a]->peek();
        const Row& rb = (*cur)[b]->peek();
        if (less(rb, ra)) return true;
        if (less(ra, rb)) return false;
        return a > b;                      // empate: arquivo anterior primeiro
    }
};

void removeConsumed(const std::filesystem::path& file)
{
    std::error_code ec;
    if (!std::filesystem::remove(file, ec) || ec)
        throw IoFailure(file, "merge",
                        "não foi possível apagar: " +
                            (ec ? ec.message() : std::string("arquivo sumiu")));
}
} // anonymous namespace

void mergeGroup(const std::vector<std::filesystem::path>& inputs,
                const std::filesystem::path& output, const SortKey& key,
                IoTracker* io)
{
    Cursors cursors;
    cursors.reserve(inputs.size());
    for (const auto& f : inputs) cursors.push_back(std::make_unique<RowCursor>(f, io));

    const std::size_t needed = requiredFields(key);
    std::priority_queue<std::size_t, std::vector<std::size_t>, HeadAfter>
        heap(HeadAfter{&cursors, KeyLess(key)});

    auto admit = [&](std::size_t i) {
        if (!cursors[i]->valid()) return;
        requireKeyFields(cursors[i]->peek(), needed, inputs[i], cursors[i]->record());
        heap.push(i);
    };
    for (std::size_t i = 0; i < cursors.size(); ++i) admit(i);

    RowWriter out(output, INTERNAL_DIALECT, "merge", io);
    while (!heap.empty()) {
        const std::size_t i = heap.top();
        heap.pop();
        out.write(cursors[i]->peek());
        cursors[i]->advance();
        admit(i);
    }
    out.close();
}

/* ----------------- passes sucessivos de merge ---------------------------- */
std::optional<std::filesystem::path>
mergeAll(std::vector<std::filesystem::path> files, const SortKey& key,
         Workspace& ws, std::size_t fanIn, IoTracker* io, MergeStats* stats)
{
    if (fanIn < 2)
        throw ConfigError("Fan-in do merge precisa ser >= 2, recebido " +
                          std::to_string(fanIn));
    if (files.empty()) return std::nullopt;

    while (files.size() > 1) {
        std::vector<std::filesystem::path> next;
        next.reserve(files.size() / fanIn + 1);

        for (std::size_t i = 0; i < files.size(); i += fanIn) {
            const auto last = std::min(i + fanIn, files.size());
            if (last - i == 1) {                 // arquivo solitário
                next.push_back(files[i]);
                continue;
            }
            std::vector<std::filesystem::path> group(files.begin() + i,
                                                     files.begin() + last);
            auto out = ws.newMergePath();
            spdlog::debug("merge de {} arquivos -> {}", group.size(), out.string());
            mergeGroup(group, out, key, io);
            for (const auto& f : group) removeConsumed(f);
            next.push_back(std::move(out));
            if (stats) ++stats->groups;
        }
        files = std::move(next);
        if (stats) ++stats->passes;
    }
    return files.front();
}

} // namespace csvsort
