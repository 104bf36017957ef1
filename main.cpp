#include "Errors.hpp"
#include "ExternalSorter.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <getopt.h>

using namespace csvsort;

namespace {
void usage(const char* prog)
{
    std::cerr
        << "Uso: " << prog << " [opções] <entrada.csv>\n"
        << "\n"
        << "Ordena um CSV grande em disco, com memória limitada.\n"
        << "\n"
        << "  -c, --column=COL      coluna da chave (índice base 0 ou nome);\n"
        << "                        repita para chaves secundárias (obrigatório)\n"
        << "  -o, --output=ARQ      arquivo de saída (padrão: sobrescreve a entrada)\n"
        << "  -s, --size=MB         tamanho máximo de cada chunk em MB (padrão: "
        << DEFAULT_CHUNK_MB << ")\n"
        << "  -n, --no-header       o CSV não tem cabeçalho\n"
        << "  -d, --delimiter=C     separador de campos (padrão: ',', 'tab' = \\t)\n"
        << "  -e, --encoding=NOME   codificação (padrão: utf-8)\n"
        << "  -Q, --quoting=POL     aspas na saída: minimal, all, nonnumeric, none\n"
        << "  -f, --fan-in=N        arquivos por merge (padrão: " << DEFAULT_FAN_IN << ")\n"
        << "  -j, --threads=N       threads para ordenar chunks (padrão: 1)\n"
        << "  -t, --tmp-dir=DIR     onde criar o workspace (padrão: .)\n"
        << "  -v, --verbose         mensagens de depuração\n"
        << "  -q, --quiet           só erros\n"
        << "  -h, --help            esta ajuda\n"
        << "\n"
        << "Exemplo:\n"
        << "  " << prog << " -c pais -c 0 -o ordenado.csv data/vinho.csv\n";
}

bool parseSize(const char* s, unsigned long long& out)
{
    if (!s || !*s || *s == '-') return false;
    char* end = nullptr;
    errno = 0;
    out = std::strtoull(s, &end, 10);
    return errno == 0 && *end == '\0';
}

bool parseDouble(const char* s, double& out)
{
    if (!s || !*s) return false;
    char* end = nullptr;
    out = std::strtod(s, &end);
    return *end == '\0';
}

bool parseDelimiter(const std::string& s, char& out)
{
    if (s == "tab" || s == "\\t") { out = '\t'; return true; }
    if (s.size() != 1) return false;
    out = s[0];
    return true;
}
} // anonymous namespace

int main(int argc, char* argv[])
{
    static const struct option longopts[] = {
        { "column",    required_argument, nullptr, 'c' },
        { "output",    required_argument, nullptr, 'o' },
        { "size",      required_argument, nullptr, 's' },
        { "no-header", no_argument,       nullptr, 'n' },
        { "delimiter", required_argument, nullptr, 'd' },
        { "encoding",  required_argument, nullptr, 'e' },
        { "quoting",   required_argument, nullptr, 'Q' },
        { "fan-in",    required_argument, nullptr, 'f' },
        { "threads",   required_argument, nullptr, 'j' },
        { "tmp-dir",   required_argument, nullptr, 't' },
        { "verbose",   no_argument,       nullptr, 'v' },
        { "quiet",     no_argument,       nullptr, 'q' },
        { "help",      no_argument,       nullptr, 'h' },
        { nullptr, 0, nullptr, 0 }
    };

    SortOptions opts;
    auto level = spdlog::level::info;
    unsigned long long n = 0;
    int opt;

    try {
        while ((opt = getopt_long(argc, argv, "c:o:s:nd:e:Q:f:j:t:vqh", longopts, nullptr)) != -1) {
            switch (opt) {
            case 'c': opts.columns.push_back(parseColumnSpec(optarg)); break;
            case 'o': opts.outputPath = optarg;                        break;
            case 's':
                if (!parseDouble(optarg, opts.maxChunkSizeMB)) {
                    std::cerr << "Erro: tamanho inválido \"" << optarg << "\"\n";
                    return 1;
                }
                break;
            case 'n': opts.hasHeader = false;                          break;
            case 'd':
                if (!parseDelimiter(optarg, opts.delimiter)) {
                    std::cerr << "Erro: separador precisa ter um caractere\n";
                    return 1;
                }
                break;
            case 'e': opts.encoding = optarg;                          break;
            case 'Q': opts.quoting = parseQuoting(optarg);             break;
            case 'f':
                if (!parseSize(optarg, n)) {
                    std::cerr << "Erro: fan-in inválido \"" << optarg << "\"\n";
                    return 1;
                }
                opts.fanIn = static_cast<std::size_t>(n);
                break;
            case 'j':
                if (!parseSize(optarg, n) || n > 1024) {
                    std::cerr << "Erro: número de threads inválido \"" << optarg << "\"\n";
                    return 1;
                }
                opts.threads = static_cast<unsigned>(n);
                break;
            case 't': opts.tmpDir = optarg;                            break;
            case 'v': level = spdlog::level::debug;                    break;
            case 'q': level = spdlog::level::err;                      break;
            case 'h': usage(argv[0]); return 0;
            default:  usage(argv[0]); return 1;
            }
        }
    } catch (const ConfigError& e) {
        std::cerr << "Erro: " << e.what() << "\n";
        return 1;
    }

    if (optind >= argc) {
        std::cerr << "Erro: qual CSV deve ser ordenado?\n";
        usage(argv[0]);
        return 1;
    }
    if (opts.columns.empty()) {
        std::cerr << "Erro: em quais colunas ordenar? (-c)\n";
        usage(argv[0]);
        return 1;
    }
    if (optind + 1 < argc) {
        std::cerr << "Erro: informe só um arquivo de entrada\n";
        return 1;
    }

    spdlog::set_level(level);

    try {
        const auto stats = externalSort(argv[optind], opts);

        spdlog::info("#Linhas     : {}", stats.rows);
        spdlog::info("#Chunks     : {}", stats.chunks);
        spdlog::info("#Passes     : {} ({} merges)", stats.mergePasses, stats.mergeGroups);
        spdlog::info("#Linhas E/S : {}", stats.io.operations());
    } catch (const ConfigError& e) {
        spdlog::error("{}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 2;
    }

    return 0;
}
