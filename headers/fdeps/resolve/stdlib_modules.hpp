//
// Created by gregorian-rayne on 2/5/26.
//

#ifndef FDEPS_STDLIB_MODULES_HPP
#define FDEPS_STDLIB_MODULES_HPP

#include <string_view>

namespace fdeps::resolve {

    /**
     * Checks whether a top-level module name belongs to the standard library.
     *
     * The list covers the commonly imported modules, not every one shipped
     * with the interpreter. Only the leading segment of a dotted name is
     * considered, so "os.path" and "os" both match.
     */
    [[nodiscard]] bool is_stdlib_module(std::string_view module_name);

}  // namespace fdeps::resolve

#endif //FDEPS_STDLIB_MODULES_HPP
