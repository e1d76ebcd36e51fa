/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __UWFRAC_EDGE_INDEX_H
#define __UWFRAC_EDGE_INDEX_H 1

#include <string>
#include <vector>
#include <unordered_map>
#include <stdint.h>

#include "tree.hpp"

namespace uw {
    /* Canonical numbering of the edges and leaves of a tree
     *
     * Every node owns the edge to its parent; the root owns a synthetic
     * edge of length 0. Edges are numbered in preorder, so the root edge
     * is 0 and a parent edge always has a smaller index than its children.
     * Leaves are numbered in the order a preorder traversal meets them,
     * which makes the leaves below any edge a contiguous range of leaf
     * positions.
     *
     * The tree must be valid. A tip name seen twice leaves the index
     * flagged invalid, with the first occurrence kept in leaf_index.
     */
    class EdgeIndex {
        public:
            static const uint32_t NOT_A_LEAF = 0xFFFFFFFF;

            uint32_t n_edges;
            uint32_t n_leaves;

            std::vector<double> lengths;         // branch length per edge, root is 0
            std::vector<uint32_t> parent;        // parent edge, the root points at itself
            std::vector<uint32_t> edge_leaf;     // leaf position of an edge, or NOT_A_LEAF
            std::vector<uint32_t> leaf_edge;     // edge of a leaf position
            std::vector<uint32_t> first_leaf;    // first leaf position below an edge
            std::vector<uint32_t> n_below;       // number of leaves below an edge
            std::vector<std::string> leaf_names; // names in leaf order

            /* default constructor
             *
             * @param tree The tree to enumerate
             */
            EdgeIndex(const BPTree &tree);
            ~EdgeIndex();

            /* Get the position of a leaf in the leaf order, -1 if unknown
             *
             * @param name The leaf name to look up
             */
            int64_t leaf_position(const std::string &name) const;

            /* false if two tips share a name */
            bool is_valid() const { return duplicate_tip.empty(); }

            /* the first tip name seen twice, empty if names are unique */
            const std::string& get_duplicate_tip() const { return duplicate_tip; }

            /* Test if a leaf descends through an edge
             *
             * @param e The edge
             * @param l The leaf position
             */
            bool leaf_under(uint32_t e, uint32_t l) const {
                return l >= first_leaf[e] && l < first_leaf[e] + n_below[e];
            }

        private:
            std::unordered_map<std::string, uint32_t> leaf_index;
            std::string duplicate_tip;
    };
}

#endif /* __UWFRAC_EDGE_INDEX_H */
