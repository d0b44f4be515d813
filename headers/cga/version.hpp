//
// Created by gregorian-rayne on 10/06/26.
//

#ifndef CGA_VERSION_HPP
#define CGA_VERSION_HPP

/**
 * @file version.hpp
 * @brief Code Graph Analyzer version information.
 *
 * Provides compile-time version constants.
 */

namespace cga {

    /**
     * Major version number.
     * Incremented for breaking API changes.
     */
    constexpr int VERSION_MAJOR = 1;

    /**
     * Minor version number.
     * Incremented for new features with backward compatibility.
     */
    constexpr int VERSION_MINOR = 0;

    /**
     * Patch version number.
     * Incremented for bug fixes.
     */
    constexpr int VERSION_PATCH = 0;

    /**
     * Full version string in "major.minor.patch" format.
     */
    constexpr auto VERSION_STRING = "1.0.0";

    /**
     * Project name.
     */
    constexpr auto PROJECT_NAME = "Code Graph Analyzer";

    /**
     * Short project name for CLI usage.
     */
    constexpr auto PROJECT_SHORT_NAME = "cga";

}  // namespace cga

#endif //CGA_VERSION_HPP
