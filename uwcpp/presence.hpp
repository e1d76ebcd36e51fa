/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __UWFRAC_PRESENCE_H
#define __UWFRAC_PRESENCE_H 1

#include <vector>
#include <stdint.h>

#include "edge_index.hpp"
#include "table_interface.hpp"

namespace uw {
    /* A fixed width bit vector, one bit per edge */
    class PresenceVector {
        public:
            PresenceVector(uint32_t n_bits = 0)
            : bits((n_bits + 63) / 64, 0)
            , nbits(n_bits)
            {}

            void set(uint32_t i) { bits[i >> 6] |= (uint64_t(1) << (i & 63)); }
            bool test(uint32_t i) const { return (bits[i >> 6] >> (i & 63)) & 1; }

            uint32_t size() const { return nbits; }
            uint32_t n_words() const { return bits.size(); }
            const uint64_t* words() const { return bits.data(); }

            /* true if at least one bit is set */
            bool any() const;

            /* number of bits set */
            uint32_t count() const;

            bool operator==(const PresenceVector &other) const {
                return nbits == other.nbits && bits == other.bits;
            }

        private:
            std::vector<uint64_t> bits;
            uint32_t nbits;
    };

    /* Visit every (sample, leaf) pair where the leaf is observed in the sample
     *
     * Table observations that are not leaves of the tree are skipped, tree
     * leaves missing from the table are never visited. An observation is
     * present when its value is > 0.
     *
     * @param table The sample table
     * @param edges The edge numbering of the tree
     * @param visit Called as visit(sample, leaf_position)
     */
    template<class TVisit>
    void for_each_present(const table_interface &table, const EdgeIndex &edges, TVisit visit) {
        std::vector<double> row(table.n_samples);

        for(uint32_t l = 0; l < edges.n_leaves; l++) {
            const std::string &name = edges.leaf_names[l];
            if(!table.has_obs(name))
                continue;

            table.get_obs_data(name, row.data());
            for(uint32_t s = 0; s < table.n_samples; s++) {
                if(row[s] > 0)
                    visit(s, l);
            }
        }
    }

    /* Mark every ancestor edge of a marked edge, bottom-up
     *
     * @param edges The edge numbering of the tree
     * @param p A vector of n_edges bits with the leaf edges of a sample set
     */
    void propagate_presence(const EdgeIndex &edges, PresenceVector &p);

    /* Project the leaves of a sample onto the edges of the tree
     *
     * @param edges The edge numbering of the tree
     * @param leaf_present One flag per leaf position
     *
     * Bit e of the result is set iff at least one present leaf is below e.
     * The root bit is set iff any leaf is present.
     */
    PresenceVector project_sample(const EdgeIndex &edges, const std::vector<bool> &leaf_present);

    /* Compute the edge presence vector of every sample of a table
     *
     * @param table The sample table
     * @param edges The edge numbering of the tree
     * @param out One vector per sample, in table sample order
     */
    void make_presence_vectors(const table_interface &table, const EdgeIndex &edges,
                               std::vector<PresenceVector> &out);
}

#endif /* __UWFRAC_PRESENCE_H */
