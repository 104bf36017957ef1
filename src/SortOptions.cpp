#include "SortOptions.hpp"
#include "Errors.hpp"
#include <algorithm>
#include <cctype>

namespace csvsort {

bool isSupportedEncoding(const std::string& name)
{
    std::string n;
    for (char c : name)
        if (c != '-' && c != '_')
            n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));

    static const char* const known[] = {
        "utf8", "ascii", "usascii", "latin1", "iso88591", "l1",
    };
    return std::find_if(std::begin(known), std::end(known),
                        [&](const char* k) { return n == k; }) != std::end(known);
}

void SortOptions::validate() const
{
    if (columns.empty())
        throw ConfigError("Informe ao menos uma coluna para ordenar");
    if (!(maxChunkSizeMB >= 0.0))
        throw ConfigError("Tamanho de chunk inválido: " + std::to_string(maxChunkSizeMB));
    if (delimiter == CSV_QUOTE || delimiter == '\n' || delimiter == '\r')
        throw ConfigError(std::string("Separador inválido: '") + delimiter + "'");
    if (fanIn < 2)
        throw ConfigError("Fan-in do merge precisa ser >= 2");
    if (threads < 1)
        throw ConfigError("Número de threads precisa ser >= 1");
    if (!isSupportedEncoding(encoding))
        throw ConfigError("Codificação não suportada: \"" + encoding + "\"");
}

} // namespace csvsort
