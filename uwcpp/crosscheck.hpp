/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __UWFRAC_CROSSCHECK_H
#define __UWFRAC_CROSSCHECK_H 1

#include <vector>
#include <stdint.h>

#include "edge_index.hpp"
#include "presence.hpp"
#include "table_interface.hpp"

namespace uw {
    /* The edge by leaf incidence matrix of a tree
     *
     * Row e holds one bit per leaf position, set iff the leaf descends
     * through edge e. The root row has every leaf set.
     */
    class PresenceMatrix {
        public:
            uint32_t n_edges;
            uint32_t n_leaves;

            /* default constructor
             *
             * @param edges The edge numbering of the tree
             */
            PresenceMatrix(const EdgeIndex &edges);
            ~PresenceMatrix();

            bool get(uint32_t e, uint32_t l) const { return rows[e].test(l); }
            const PresenceVector& row(uint32_t e) const { return rows[e]; }

            /* P = clamp(B . x), the edges covered by a set of leaves
             *
             * @param leaves One bit per leaf position
             */
            PresenceVector project(const PresenceVector &leaves) const;

        private:
            std::vector<PresenceVector> rows;
    };

    /* shared = P_a . (Br . P_b), with Br the diagonal matrix of branch lengths */
    double shared_length_matrix_form(const PresenceVector &a, const PresenceVector &b,
                                     const std::vector<double> &lengths);

    /* union = clamp(P_a + P_b) . b */
    double union_length_matrix_form(const PresenceVector &a, const PresenceVector &b,
                                    const std::vector<double> &lengths);

    /* Verify a distance matrix against the matrix product formulation
     *
     * Every sample is re-projected through the incidence matrix and every
     * pair is recomputed in the product form. Both the presence vectors and
     * the distances must agree exactly.
     *
     * @param table The sample table the matrix was computed from
     * @param edges The edge numbering of the tree
     * @param presence The presence vectors used for the matrix
     * @param buf2d The n_samples x n_samples distance matrix, row major
     * @return The number of disagreeing samples and cells, 0 if consistent
     */
    uint64_t crosscheck_matrix(const table_interface &table, const EdgeIndex &edges,
                               const std::vector<PresenceVector> &presence,
                               const double* buf2d);
}

#endif /* __UWFRAC_CROSSCHECK_H */
