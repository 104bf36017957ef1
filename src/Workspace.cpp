#include "Workspace.hpp"
#include "Errors.hpp"
#include <spdlog/spdlog.h>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>
#include <unistd.h>

namespace csvsort {

Workspace::Workspace(const std::filesystem::path& parent)
{
    const auto base = parent.empty() ? std::filesystem::path{"."} : parent;
    std::string tmpl = (base / (".csvsort." + std::to_string(::getpid()) + ".XXXXXX")).string();

    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');
    if (!::mkdtemp(buf.data()))
        throw IoFailure(base, "workspace",
                        std::string("não foi possível criar diretório temporário: ") +
                            std::strerror(errno));
    dir_ = buf.data();
    spdlog::debug("workspace criado: {}", dir_.string());
}

Workspace::~Workspace()
{
    remove();
}

std::filesystem::path Workspace::newChunkPath()
{
    return dir_ / ("split" + std::to_string(chunks_++) + ".csv");
}

std::filesystem::path Workspace::newMergePath()
{
    return dir_ / ("merge" + std::to_string(merges_++) + ".csv");
}

bool Workspace::remove() noexcept
{
    if (dir_.empty()) return true;

    std::error_code ec;
    std::filesystem::remove_all(dir_, ec);
    if (ec) {
        spdlog::warn("não foi possível apagar o workspace {}: {}",
                     dir_.string(), ec.message());
        return false;
    }
    spdlog::debug("workspace removido: {}", dir_.string());
    dir_.clear();
    return true;
}

} // namespace csvsort
