//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef FDEPS_VERSION_HPP
#define FDEPS_VERSION_HPP

/**
 * @file version.hpp
 * @brief fastdeps version information.
 */

namespace fdeps {

    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "0.3.0";

    constexpr auto PROJECT_NAME = "fastdeps";

    /**
     * Name of the per-project configuration file looked up in the target directory.
     */
    constexpr auto CONFIG_FILE_NAME = ".fastdeps.toml";

}  // namespace fdeps

#endif //FDEPS_VERSION_HPP
