#pragma once
#include <cstddef>

namespace csvsort {

/* ---------------------------------------------------------------------------
 *  Contador de linhas lidas / gravadas e arquivos criados em uma execução.
 *  Um por pipeline; leitores e escritores recebem um ponteiro (pode ser nulo).
 * --------------------------------------------------------------------------*/
struct IoTracker {
    std::size_t reads  = 0;   // linhas lidas
    std::size_t writes = 0;   // linhas gravadas
    std::size_t files  = 0;   // arquivos criados

    void   incRead()             { ++reads;  }
    void   incWrite()            { ++writes; }
    void   incFile()             { ++files;  }
    size_t operations()    const { return reads + writes; }
};

} // namespace csvsort
