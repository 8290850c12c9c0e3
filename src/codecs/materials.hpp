#pragma once

#include <string>

struct library_t;

namespace codec {
  namespace materials {
    /**
     * ! Imports a material library in YAML format from 'path'
     * and adds all materials to 'library'.
     */
    void import(const std::string& path, library_t& library);

    /**
     * ! Same as import, but reads the YAML document from 'document'
     */
    void parse(const std::string& document, library_t& library);
  }
}
