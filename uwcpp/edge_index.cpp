/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include "edge_index.hpp"

using namespace uw;

const uint32_t EdgeIndex::NOT_A_LEAF;

EdgeIndex::EdgeIndex(const BPTree &tree)
: n_edges(tree.n_nodes())
, n_leaves(0)
, lengths(n_edges, 0.0)
, parent(n_edges, 0)
, edge_leaf(n_edges, NOT_A_LEAF)
, leaf_edge()
, first_leaf(n_edges, 0)
, n_below(n_edges, 0)
, leaf_names()
, leaf_index()
, duplicate_tip()
{
    // opening parenthesis -> edge
    std::vector<uint32_t> edge_of(tree.nparens, 0);

    for(uint32_t k = 0; k < n_edges; k++) {
        uint32_t node = tree.preorderselect(k);
        edge_of[node] = k;

        if(k > 0) {
            // preorder, so the parent edge has already been assigned
            lengths[k] = tree.lengths[node];
            parent[k] = edge_of[tree.parent(node)];
        }

        // nothing but this subtree is visited before its first leaf
        first_leaf[k] = n_leaves;

        if(tree.isleaf(node)) {
            edge_leaf[k] = n_leaves;
            leaf_edge.push_back(k);
            leaf_names.push_back(tree.names[node]);
            if(!leaf_index.insert(std::make_pair(tree.names[node], n_leaves)).second && duplicate_tip.empty())
                duplicate_tip = tree.names[node];
            n_leaves++;
        }
    }

    for(uint32_t k = 0; k < n_edges; k++) {
        uint32_t e = edge_of[tree.postorderselect(k)];

        if(edge_leaf[e] != NOT_A_LEAF)
            n_below[e] = 1;
        if(e > 0)
            n_below[parent[e]] += n_below[e];
    }
}

EdgeIndex::~EdgeIndex() {
}

int64_t EdgeIndex::leaf_position(const std::string &name) const {
    auto hit = leaf_index.find(name);
    if(hit == leaf_index.end())
        return -1;
    return hit->second;
}
