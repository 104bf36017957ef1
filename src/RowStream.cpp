#include "RowStream.hpp"
#include "Errors.hpp"
#include <cerrno>
#include <cstring>
#include <system_error>

namespace csvsort {

namespace {
std::string lastError()
{
    return errno ? std::strerror(errno) : "erro de E/S";
}
} // anonymous namespace

/* ----------------------------- RowReader --------------------------------- */
RowReader::RowReader(std::filesystem::path path, char delimiter,
                     std::string phase, IoTracker* io)
    : path_(std::move(path)), delimiter_(delimiter), phase_(std::move(phase)),
      io_(io)
{
    errno = 0;
    fin_.open(path_, std::ios::in | std::ios::binary);
    if (!fin_)
        throw IoFailure(path_, phase_, "não foi possível abrir: " + lastError());

    std::error_code ec;
    expected_ = std::filesystem::file_size(path_, ec);
    sized_    = !ec;
}

bool RowReader::next(Row& out)
{
    const auto st = readRecord(fin_, delimiter_, out);
    if (fin_.bad())
        throw IoFailure(path_, phase_, "falha de leitura: " + lastError());
    if (st == ReadStatus::End) {
        if (sized_) {
            const auto pos = fin_.rdbuf()->pubseekoff(0, std::ios::cur, std::ios::in);
            if (pos != std::streampos(-1) &&
                static_cast<std::uintmax_t>(std::streamoff(pos)) < expected_)
                throw IoFailure(path_, phase_, "leitura parou antes do fim do arquivo");
        }
        return false;
    }
    ++record_;
    if (st == ReadStatus::Unterminated)
        throw MalformedRow(path_, record_, "campo entre aspas sem fechamento");
    if (io_) io_->incRead();
    return true;
}

void RowReader::close()
{
    if (fin_.is_open()) fin_.close();
}

/* ----------------------------- RowWriter --------------------------------- */
RowWriter::RowWriter(std::filesystem::path path, const Dialect& dialect,
                     std::string phase, IoTracker* io)
    : path_(std::move(path)), dialect_(dialect), phase_(std::move(phase)), io_(io)
{
    errno = 0;
    fout_.open(path_, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!fout_)
        throw IoFailure(path_, phase_, "não foi possível criar: " + lastError());
    if (io_) io_->incFile();
}

void RowWriter::write(const Row& row)
{
    if (!formatRecord(row, dialect_, line_))
        throw IoFailure(path_, phase_,
                        "campo precisa de aspas mas a política é \"none\" (linha " +
                            std::to_string(rows_ + 1) + ")");
    fout_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
    if (!fout_)
        throw IoFailure(path_, phase_, "falha de escrita: " + lastError());
    ++rows_;
    if (io_) io_->incWrite();
}

void RowWriter::close()
{
    if (!fout_.is_open()) return;
    fout_.flush();
    const bool ok = static_cast<bool>(fout_);
    fout_.close();
    if (!ok || fout_.fail())
        throw IoFailure(path_, phase_, "falha ao fechar: " + lastError());
}

} // namespace csvsort
