#include "Table.hpp"
#include <spdlog/spdlog.h>

namespace csvsort {

Table::Table(std::filesystem::path csvPath, char delimiter, bool hasHeader,
             IoTracker* io)
    : path_(std::move(csvPath)), rows_(path_, delimiter, "input", io)
{
    if (!hasHeader) return;

    Row hdr;
    if (rows_.next(hdr))
        header_ = std::move(hdr);
    else
        spdlog::warn("CSV vazio, sem cabeçalho: {}", path_.string());
}

} // namespace csvsort
