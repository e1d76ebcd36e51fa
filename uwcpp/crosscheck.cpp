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
#include "crosscheck.hpp"

using namespace uw;

PresenceMatrix::PresenceMatrix(const EdgeIndex &edges)
: n_edges(edges.n_edges)
, n_leaves(edges.n_leaves)
, rows(edges.n_edges, PresenceVector(edges.n_leaves))
{
    for(uint32_t l = 0; l < n_leaves; l++)
        rows[edges.leaf_edge[l]].set(l);

    // a row is complete before it is merged into its parent
    for(uint32_t e = n_edges; e-- > 1;) {
        const uint64_t *src = rows[e].words();
        PresenceVector &dst = rows[edges.parent[e]];
        for(uint32_t w = 0; w < dst.n_words(); w++) {
            uint64_t bits = src[w];
            while(bits) {
                dst.set((w << 6) + __builtin_ctzll(bits));
                bits &= bits - 1;
            }
        }
    }
}

PresenceMatrix::~PresenceMatrix() {
}

PresenceVector PresenceMatrix::project(const PresenceVector &leaves) const {
    if(leaves.size() != n_leaves) {
        fprintf(stderr, "Leaf vector has %u bits, matrix has %u leaves; [%s]:%d\n",
                leaves.size(), n_leaves, __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }

    PresenceVector p(n_edges);
    const uint64_t *x = leaves.words();
    for(uint32_t e = 0; e < n_edges; e++) {
        const uint64_t *b = rows[e].words();
        uint64_t dot = 0;
        for(uint32_t w = 0; w < leaves.n_words(); w++)
            dot += __builtin_popcountll(b[w] & x[w]);
        if(dot > 0)
            p.set(e);
    }
    return p;
}

static inline void check_dimensions(const PresenceVector &a, const PresenceVector &b,
                                    const std::vector<double> &lengths) {
    if(a.size() != lengths.size() || b.size() != lengths.size()) {
        fprintf(stderr, "Presence vectors (%u, %u) do not match %zu branch lengths; [%s]:%d\n",
                a.size(), b.size(), lengths.size(), __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }
}

double uw::shared_length_matrix_form(const PresenceVector &a, const PresenceVector &b,
                                     const std::vector<double> &lengths) {
    check_dimensions(a, b, lengths);

    double shared = 0.0;
    for(uint32_t e = 0; e < lengths.size(); e++) {
        double pa = a.test(e) ? 1.0 : 0.0;
        double pb = b.test(e) ? 1.0 : 0.0;
        shared += pa * (lengths[e] * pb);
    }
    return shared;
}

double uw::union_length_matrix_form(const PresenceVector &a, const PresenceVector &b,
                                    const std::vector<double> &lengths) {
    check_dimensions(a, b, lengths);

    double total = 0.0;
    for(uint32_t e = 0; e < lengths.size(); e++) {
        double pa = a.test(e) ? 1.0 : 0.0;
        double pb = b.test(e) ? 1.0 : 0.0;
        double either = pa + pb > 1.0 ? 1.0 : pa + pb;
        total += either * lengths[e];
    }
    return total;
}

struct mark_leaf {
    std::vector<PresenceVector> &leaves;

    mark_leaf(std::vector<PresenceVector> &_leaves) : leaves(_leaves) {}

    void operator()(uint32_t sample, uint32_t leaf) const {
        leaves[sample].set(leaf);
    }
};

uint64_t uw::crosscheck_matrix(const table_interface &table, const EdgeIndex &edges,
                               const std::vector<PresenceVector> &presence,
                               const double* buf2d) {
    const uint64_t n_samples = table.n_samples;
    if(presence.size() != n_samples) {
        fprintf(stderr, "Have %zu presence vectors for %u samples; [%s]:%d\n",
                presence.size(), table.n_samples, __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }

    PresenceMatrix B(edges);

    std::vector<PresenceVector> leaves(n_samples, PresenceVector(edges.n_leaves));
    for_each_present(table, edges, mark_leaf(leaves));

    uint64_t mismatches = 0;
    std::vector<PresenceVector> projected;
    projected.reserve(n_samples);

    for(uint64_t i = 0; i < n_samples; i++) {
        projected.push_back(B.project(leaves[i]));
        if(!(projected[i] == presence[i])) {
            if(mismatches == 0)
                fprintf(stderr, "Presence of sample %s differs between the direct and matrix forms\n",
                        table.sample_ids[i].c_str());
            mismatches++;
        }
    }

    for(uint64_t i = 0; i < n_samples; i++) {
        if(buf2d[i * n_samples + i] != 0.0) {
            if(mismatches == 0)
                fprintf(stderr, "Nonzero self distance for sample %s\n", table.sample_ids[i].c_str());
            mismatches++;
        }

        for(uint64_t j = i + 1; j < n_samples; j++) {
            double shared = shared_length_matrix_form(projected[i], projected[j], edges.lengths);
            double total = union_length_matrix_form(projected[i], projected[j], edges.lengths);
            double expected = total <= 0.0 ? 0.0 : 1.0 - shared / total;

            const double observed = buf2d[i * n_samples + j];
            if(observed != expected || buf2d[j * n_samples + i] != expected) {
                if(mismatches == 0)
                    fprintf(stderr, "Distance (%s, %s) is %.17g, matrix form gives %.17g\n",
                            table.sample_ids[i].c_str(), table.sample_ids[j].c_str(),
                            observed, expected);
                mismatches++;
            }
        }
    }

    return mismatches;
}
