#pragma once
#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <utility>

namespace csvsort {

/* ==========================================================================
 *  Hierarquia de erros do csvsort.
 *  Todas as falhas são fatais para a execução corrente; ninguém no núcleo
 *  tenta de novo.  Quem chama captura CsvSortError (ou std::exception).
 * ==========================================================================*/
class CsvSortError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/* ---------------- resolução de colunas -------------------------------------*/
class ColumnError : public CsvSortError {
public:
    ColumnError(const std::string& msg, std::string spec)
        : CsvSortError(msg), spec_(std::move(spec)) {}

    const std::string& spec() const { return spec_; }

private:
    std::string spec_;
};

class ColumnOutOfRange : public ColumnError {
public:
    ColumnOutOfRange(std::size_t index, std::size_t width);

    std::size_t index() const { return index_; }
    std::size_t width() const { return width_; }

private:
    std::size_t index_;
    std::size_t width_;
};

class ColumnNotFound : public ColumnError {
public:
    explicit ColumnNotFound(const std::string& name);
};

class MissingHeader : public ColumnError {
public:
    explicit MissingHeader(const std::string& name);
};

/* ---------------- E/S: arquivo + fase do pipeline --------------------------*/
class IoFailure : public CsvSortError {
public:
    IoFailure(std::filesystem::path file, std::string phase,
              const std::string& what);

    const std::filesystem::path& file()  const { return file_;  }
    const std::string&           phase() const { return phase_; }

private:
    std::filesystem::path file_;
    std::string           phase_;
};

/* ---------------- linha sem a coluna da chave ------------------------------*/
class MalformedRow : public CsvSortError {
public:
    MalformedRow(std::filesystem::path file, std::size_t record,
                 std::size_t required, std::size_t found);
    MalformedRow(std::filesystem::path file, std::size_t record,
                 const std::string& what);

    const std::filesystem::path& file()   const { return file_;   }
    std::size_t                  record() const { return record_; }

private:
    std::filesystem::path file_;
    std::size_t           record_;
};

/* ---------------- opções inválidas -----------------------------------------*/
class ConfigError : public CsvSortError {
public:
    using CsvSortError::CsvSortError;
};

} // namespace csvsort
