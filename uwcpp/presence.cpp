/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <cstdlib>
#include <stdio.h>
#include "presence.hpp"

using namespace uw;

bool PresenceVector::any() const {
    for(auto it = bits.begin(); it != bits.end(); it++) {
        if(*it)
            return true;
    }
    return false;
}

uint32_t PresenceVector::count() const {
    uint32_t total = 0;
    for(auto it = bits.begin(); it != bits.end(); it++)
        total += __builtin_popcountll(*it);
    return total;
}

void uw::propagate_presence(const EdgeIndex &edges, PresenceVector &p) {
    if(p.size() != edges.n_edges) {
        fprintf(stderr, "Presence vector has %u edges, tree has %u; [%s]:%d\n",
                p.size(), edges.n_edges, __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }

    // children have larger indices than their parent, so a descending
    // sweep sees a subtree completely before its parent edge
    for(uint32_t e = edges.n_edges; e-- > 1;) {
        if(p.test(e))
            p.set(edges.parent[e]);
    }
}

PresenceVector uw::project_sample(const EdgeIndex &edges, const std::vector<bool> &leaf_present) {
    if(leaf_present.size() != edges.n_leaves) {
        fprintf(stderr, "Sample has %zu leaf flags, tree has %u leaves; [%s]:%d\n",
                leaf_present.size(), edges.n_leaves, __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }

    PresenceVector p(edges.n_edges);
    for(uint32_t l = 0; l < edges.n_leaves; l++) {
        if(leaf_present[l])
            p.set(edges.leaf_edge[l]);
    }
    propagate_presence(edges, p);

    return p;
}

struct mark_leaf_edge {
    const EdgeIndex &edges;
    std::vector<PresenceVector> &out;

    mark_leaf_edge(const EdgeIndex &_edges, std::vector<PresenceVector> &_out)
    : edges(_edges), out(_out) {}

    void operator()(uint32_t sample, uint32_t leaf) const {
        out[sample].set(edges.leaf_edge[leaf]);
    }
};

void uw::make_presence_vectors(const table_interface &table, const EdgeIndex &edges,
                               std::vector<PresenceVector> &out) {
    out.assign(table.n_samples, PresenceVector(edges.n_edges));

    for_each_present(table, edges, mark_leaf_edge(edges, out));

    // samples are independent
#pragma omp parallel for schedule(dynamic)
    for(int64_t s = 0; s < (int64_t)table.n_samples; s++)
        propagate_presence(edges, out[s]);
}
