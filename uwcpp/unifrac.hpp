/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __UWFRAC
#define __UWFRAC 1

#include <string>
#include <vector>
#include <thread>

#include "task_parameters.hpp"
#include "tree.hpp"
#include "edge_index.hpp"
#include "presence.hpp"
#include "table_interface.hpp"

namespace uw {
    /* return the first tip name found more than once, empty if tip names are unique */
    std::string find_duplicate_tip_name(const BPTree &tree);

    /* return the table observations which are not tips of the tree, in table order */
    std::vector<std::string> table_ids_not_in_tree(const table_interface &table, const EdgeIndex &edges);

    /* Sum the branch length shared by, and covered by either of, two samples
     *
     * @param a Presence vector of the first sample
     * @param b Presence vector of the second sample
     * @param lengths Branch length per edge
     * @param shared Output, sum of lengths[e] where both a and b have e
     * @param total Output, sum of lengths[e] where a or b has e
     *
     * Sums are accumulated in ascending edge order.
     */
    void branch_sums(const PresenceVector &a, const PresenceVector &b,
                     const std::vector<double> &lengths,
                     double &shared, double &total);

    /* Unweighted UniFrac between two samples
     *
     * 1 - shared / total, or 0 if neither sample covers any branch length.
     */
    double unweighted_unifrac(const PresenceVector &a, const PresenceVector &b,
                              const std::vector<double> &lengths);

    /* Compute the rows of a distance matrix assigned to a task
     *
     * @param presence One presence vector per sample
     * @param lengths Branch length per edge
     * @param buf2d The n_samples x n_samples output matrix, row major
     * @param task_p The rows to compute
     */
    void unifrac(const std::vector<PresenceVector> &presence,
                 const std::vector<double> &lengths,
                 double* buf2d,
                 const task_parameters* task_p);

    /* Split the rows of an n_samples matrix so every task gets about the same
     * number of sample pairs; nthreads must be in [1, n_samples]
     */
    void set_tasks(std::vector<uw::task_parameters> &tasks,
                   unsigned int n_samples,
                   unsigned int nthreads);

    // run every task on its own thread and wait for all of them
    void process_rows(const std::vector<PresenceVector> &presence,
                      const std::vector<double> &lengths,
                      double* buf2d,
                      std::vector<std::thread> &threads,
                      std::vector<uw::task_parameters> &tasks);
}

#endif
