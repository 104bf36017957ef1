#include "ColumnResolver.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>
#include <limits>

namespace csvsort {

ColumnSpec parseColumnSpec(const std::string& text)
{
    const bool digits = !text.empty() &&
        std::all_of(text.begin(), text.end(),
                    [](unsigned char c) { return std::isdigit(c) != 0; });
    if (!digits) return text;

    std::size_t idx = 0;
    for (char c : text) {
        const std::size_t d = static_cast<std::size_t>(c - '0');
        if (idx > (std::numeric_limits<std::size_t>::max() - d) / 10)
            throw ConfigError("Índice de coluna grande demais: \"" + text + "\"");
        idx = idx * 10 + d;
    }
    return idx;
}

std::string toString(const ColumnSpec& spec)
{
    if (const auto* idx = std::get_if<std::size_t>(&spec))
        return std::to_string(*idx);
    return std::get<std::string>(spec);
}

SortKey resolveColumns(const std::vector<ColumnSpec>& specs,
                       const std::optional<Row>& header)
{
    SortKey key;
    key.reserve(specs.size());

    for (const auto& spec : specs) {
        if (const auto* idx = std::get_if<std::size_t>(&spec)) {
            if (header && *idx >= header->cols.size())
                throw ColumnOutOfRange(*idx, header->cols.size());
            key.push_back(*idx);
            continue;
        }

        const auto& name = std::get<std::string>(spec);
        if (!header) throw MissingHeader(name);

        const auto& cols = header->cols;
        const auto it = std::find(cols.begin(), cols.end(), name);
        if (it == cols.end()) throw ColumnNotFound(name);
        key.push_back(static_cast<std::size_t>(it - cols.begin()));
    }
    return key;
}

} // namespace csvsort
