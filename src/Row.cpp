#include "Row.hpp"
#include "Errors.hpp"
#include <algorithm>

namespace csvsort {

std::size_t estimateRowBytes(const Row& row)
{
    std::size_t bytes = ROW_OVERHEAD_BYTES;
    for (const auto& c : row.cols) bytes += c.size() + FIELD_OVERHEAD_BYTES;
    return bytes;
}

std::size_t requiredFields(const SortKey& key)
{
    if (key.empty()) return 0;
    return *std::max_element(key.begin(), key.end()) + 1;
}

void requireKeyFields(const Row& row, std::size_t needed,
                      const std::filesystem::path& file, std::size_t record)
{
    if (row.cols.size() < needed)
        throw MalformedRow(file, record, needed, row.cols.size());
}

} // namespace csvsort
