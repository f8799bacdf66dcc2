//
// Created by gregorian-rayne on 2/4/26.
//

#ifndef FDEPS_IMPORT_EXTRACTOR_HPP
#define FDEPS_IMPORT_EXTRACTOR_HPP

/**
 * @file import_extractor.hpp
 * @brief Contract for turning one source file into import records.
 *
 * The analysis core never inspects syntax itself; it only depends on this
 * interface. Implementations must not execute the file and must be safe to
 * call concurrently from several workers.
 */

#include "fdeps/result.hpp"
#include "fdeps/error.hpp"
#include "fdeps/types.hpp"

#include <functional>
#include <string_view>

namespace fdeps::extract {

    class IImportExtractor {
    public:
        virtual ~IImportExtractor() = default;

        /**
         * Returns the extractor name, used in diagnostics.
         */
        [[nodiscard]] virtual std::string_view name() const noexcept = 0;

        /**
         * Extracts the import records of one file, in source order.
         *
         * @param path Path to the source file.
         * @return The records, or an error for unreadable or malformed input.
         */
        [[nodiscard]] virtual Result<ImportList, Error> extract(const fs::path& path) const = 0;
    };

    /**
     * Callable form of an extractor, as handed to the extraction pipeline.
     */
    using ExtractFn = std::function<Result<ImportList, Error>(const fs::path&)>;

}  // namespace fdeps::extract

#endif //FDEPS_IMPORT_EXTRACTOR_HPP
