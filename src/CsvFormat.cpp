#include "CsvFormat.hpp"
#include "Errors.hpp"
#include <cctype>
#include <istream>

namespace csvsort {

Quoting parseQuoting(const std::string& name)
{
    std::string n;
    for (char c : name)
        if (c != '_' && c != '-') n += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (n.compare(0, 5, "quote") == 0) n.erase(0, 5);     // QUOTE_ALL etc.
    if (n == "minimal")    return Quoting::Minimal;
    if (n == "all")        return Quoting::All;
    if (n == "nonnumeric") return Quoting::NonNumeric;
    if (n == "none")       return Quoting::None;
    throw ConfigError("Política de aspas desconhecida: \"" + name + "\"");
}

const char* quotingName(Quoting q)
{
    switch (q) {
    case Quoting::Minimal:    return "minimal";
    case Quoting::All:        return "all";
    case Quoting::NonNumeric: return "nonnumeric";
    case Quoting::None:       return "none";
    }
    return "?";
}

ReadStatus readRecord(std::istream& in, char delimiter, Row& out)
{
    using traits = std::char_traits<char>;
    out.cols.clear();

    std::streambuf* sb = in.rdbuf();
    if (!sb) { in.setstate(std::ios::badbit); return ReadStatus::End; }

    std::string field;
    bool any = false, inQuotes = false, quoted = false;
    for (;;) {
        const auto ch = sb->sbumpc();
        if (traits::eq_int_type(ch, traits::eof())) {
            in.setstate(std::ios::eofbit);
            if (inQuotes) return ReadStatus::Unterminated;
            if (!any)     return ReadStatus::End;
            out.cols.emplace_back(std::move(field));
            return ReadStatus::Ok;
        }
        const char c = traits::to_char_type(ch);

        if (inQuotes) {
            if (c != CSV_QUOTE) { field += c; continue; }
            if (traits::eq_int_type(sb->sgetc(), traits::to_int_type(CSV_QUOTE))) {
                sb->sbumpc();
                field += CSV_QUOTE;
            } else {
                inQuotes = false;
            }
            continue;
        }

        if (c == '\n' || c == '\r') {
            if (c == '\r' && traits::eq_int_type(sb->sgetc(), traits::to_int_type('\n')))
                sb->sbumpc();
            if (!any) continue;                  // linha em branco
            out.cols.emplace_back(std::move(field));
            return ReadStatus::Ok;
        }

        any = true;
        if (c == delimiter) {
            out.cols.emplace_back(std::move(field));
            field.clear();
            quoted = false;
        } else if (c == CSV_QUOTE && field.empty() && !quoted) {
            inQuotes = quoted = true;
        } else {
            field += c;
        }
    }
}

namespace {
bool needsQuotes(const std::string& f, char delimiter)
{
    for (char c : f)
        if (c == delimiter || c == CSV_QUOTE || c == '\n' || c == '\r') return true;
    return false;
}

void appendQuoted(std::string& out, const std::string& f)
{
    out += CSV_QUOTE;
    for (char c : f) {
        if (c == CSV_QUOTE) out += CSV_QUOTE;
        out += c;
    }
    out += CSV_QUOTE;
}
} // anonymous namespace

bool formatRecord(const Row& row, const Dialect& d, std::string& out)
{
    out.clear();
    /* um único campo vazio viraria linha em branco, que o leitor pula */
    const bool loneEmpty = row.cols.size() == 1 && row.cols[0].empty();

    for (std::size_t i = 0; i < row.cols.size(); ++i) {
        if (i) out += d.delimiter;
        const auto& f = row.cols[i];

        bool quote = false;
        switch (d.quoting) {
        /* campos são sempre texto: NonNumeric equivale a All */
        case Quoting::All:
        case Quoting::NonNumeric: quote = true;                                  break;
        case Quoting::Minimal:    quote = loneEmpty || needsQuotes(f, d.delimiter); break;
        case Quoting::None:
            if (loneEmpty || needsQuotes(f, d.delimiter)) return false;
            break;
        }
        if (quote) appendQuoted(out, f);
        else       out += f;
    }
    out += CSV_EOL;
    return true;
}

} // namespace csvsort
