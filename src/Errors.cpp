#include "Errors.hpp"

namespace csvsort {

ColumnOutOfRange::ColumnOutOfRange(std::size_t index, std::size_t width)
    : ColumnError("Índice de coluna fora do intervalo: \"" +
                      std::to_string(index) + "\" (cabeçalho tem " +
                      std::to_string(width) + " colunas)",
                  std::to_string(index)),
      index_(index), width_(width)
{
}

ColumnNotFound::ColumnNotFound(const std::string& name)
    : ColumnError("Coluna não encontrada no cabeçalho: \"" + name + "\"", name)
{
}

MissingHeader::MissingHeader(const std::string& name)
    : ColumnError("CSV precisa de cabeçalho para achar a coluna \"" + name + "\"",
                  name)
{
}

IoFailure::IoFailure(std::filesystem::path file, std::string phase,
                     const std::string& what)
    : CsvSortError("[" + phase + "] " + file.string() + ": " + what),
      file_(std::move(file)), phase_(std::move(phase))
{
}

MalformedRow::MalformedRow(std::filesystem::path file, std::size_t record,
                           std::size_t required, std::size_t found)
    : CsvSortError(file.string() + ": registro " + std::to_string(record) +
                   " tem " + std::to_string(found) + " campos, a chave exige " +
                   std::to_string(required)),
      file_(std::move(file)), record_(record)
{
}

MalformedRow::MalformedRow(std::filesystem::path file, std::size_t record,
                           const std::string& what)
    : CsvSortError(file.string() + ": registro " + std::to_string(record) +
                   ": " + what),
      file_(std::move(file)), record_(record)
{
}

} // namespace csvsort
