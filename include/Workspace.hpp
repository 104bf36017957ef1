#pragma once
#include <cstddef>
#include <filesystem>

namespace csvsort {

/* ==========================================================================
 *  Diretório temporário de uma execução.  Dono de todos os arquivos de
 *  chunk e de merge; é apagado inteiro no destrutor, com sucesso ou erro.
 *  Nome único: .csvsort.<pid>.XXXXXX (mkdtemp) dentro de `parent`.
 * ==========================================================================*/
class Workspace {
public:
    explicit Workspace(const std::filesystem::path& parent);
    ~Workspace();

    Workspace(const Workspace&)            = delete;
    Workspace& operator=(const Workspace&) = delete;

    const std::filesystem::path& path() const { return dir_; }

    std::filesystem::path newChunkPath();    // split<N>.csv
    std::filesystem::path newMergePath();    // merge<N>.csv

    /* Apaga o diretório agora; devolve false (e registra) se algo ficou. */
    bool remove() noexcept;

private:
    std::filesystem::path dir_;
    std::size_t           chunks_ = 0;
    std::size_t           merges_ = 0;
};

} // namespace csvsort
