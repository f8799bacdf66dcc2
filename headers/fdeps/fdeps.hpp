//
// Created by gregorian-rayne on 2/3/26.
//

#ifndef FDEPS_FDEPS_HPP
#define FDEPS_FDEPS_HPP

/**
 * @file fdeps.hpp
 * @brief Main header for the fastdeps library.
 *
 * Pulls in the analysis entry point together with the graph, report and
 * configuration types it returns. Include specific headers for more
 * targeted dependencies.
 */

#include "version.hpp"
#include "error.hpp"
#include "result.hpp"
#include "types.hpp"
#include "config.hpp"
#include "analysis/dependency_analyzer.hpp"
#include "graph/dependency_graph.hpp"
#include "graph/graph_algorithms.hpp"
#include "export/report.hpp"

#endif //FDEPS_FDEPS_HPP
