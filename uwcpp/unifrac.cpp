/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include "unifrac.hpp"
#include <unordered_set>
#include <functional>
#include <cstdlib>
#include <stdio.h>

#include "unifrac_internal.hpp"

using namespace uw;

std::string uw::find_duplicate_tip_name(const BPTree &tree) {
    std::vector<std::string> tip_names = tree.get_tip_names();
    std::unordered_set<std::string> observed;

    for(auto i = tip_names.begin(); i != tip_names.end(); i++) {
        if(!observed.insert(*i).second)
            return *i;
    }
    return "";
}

std::vector<std::string> uw::table_ids_not_in_tree(const table_interface &table, const EdgeIndex &edges) {
    std::vector<std::string> missing;

    for(auto i = table.obs_ids.begin(); i != table.obs_ids.end(); i++) {
        if(edges.leaf_position(*i) < 0)
            missing.push_back(*i);
    }
    return missing;
}

static inline void check_dimensions(const PresenceVector &a, const PresenceVector &b,
                                    const std::vector<double> &lengths) {
    if(a.size() != lengths.size() || b.size() != lengths.size()) {
        fprintf(stderr, "Presence vectors (%u, %u) do not match %zu branch lengths; [%s]:%d\n",
                a.size(), b.size(), lengths.size(), __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }
}

// unchecked, the caller has verified the dimensions
static inline void branch_sums_unchecked(const PresenceVector &a, const PresenceVector &b,
                                         const double* __restrict__ lengths,
                                         double &shared, double &total) {
    const uint64_t * __restrict__ wa = a.words();
    const uint64_t * __restrict__ wb = b.words();
    const uint32_t n_words = a.n_words();

    double s = 0.0;
    double t = 0.0;
    for(uint32_t w = 0; w < n_words; w++) {
        const double *base = lengths + ((uint64_t)w << 6);

        uint64_t both = wa[w] & wb[w];
        while(both) {
            s += base[__builtin_ctzll(both)];
            both &= both - 1;
        }

        uint64_t either = wa[w] | wb[w];
        while(either) {
            t += base[__builtin_ctzll(either)];
            either &= either - 1;
        }
    }
    shared = s;
    total = t;
}

static inline double distance_from_sums(double shared, double total) {
    // neither sample covers any branch length
    if(total <= 0.0)
        return 0.0;
    return 1.0 - shared / total;
}

void uw::branch_sums(const PresenceVector &a, const PresenceVector &b,
                     const std::vector<double> &lengths,
                     double &shared, double &total) {
    check_dimensions(a, b, lengths);
    branch_sums_unchecked(a, b, lengths.data(), shared, total);
}

double uw::unweighted_unifrac(const PresenceVector &a, const PresenceVector &b,
                              const std::vector<double> &lengths) {
    double shared, total;
    uw::branch_sums(a, b, lengths, shared, total);
    return distance_from_sums(shared, total);
}

void uw::unifrac(const std::vector<PresenceVector> &presence,
                 const std::vector<double> &lengths,
                 double* buf2d,
                 const task_parameters* task_p) {
    const uint64_t n_samples = task_p->n_samples;

    if(presence.size() != n_samples || task_p->stop > n_samples) {
        fprintf(stderr, "Task and presence n_samples not equal; [%s]:%d\n", __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }
    for(unsigned int i = task_p->start; i < task_p->stop; i++)
        check_dimensions(presence[i], presence[i], lengths);

    const unsigned int max_k = task_p->stop - task_p->start;
    const double *lengths_ptr = lengths.data();

    for(uint64_t i = task_p->start; i < task_p->stop; i++) {
        try_report(task_p, i - task_p->start, max_k);

        buf2d[i * n_samples + i] = 0.0;
        for(uint64_t j = i + 1; j < n_samples; j++) {
            double shared, total;
            branch_sums_unchecked(presence[i], presence[j], lengths_ptr, shared, total);

            const double d = distance_from_sums(shared, total);
            buf2d[i * n_samples + j] = d;
            buf2d[j * n_samples + i] = d;
        }
    }
}

void uw::set_tasks(std::vector<uw::task_parameters> &tasks,
                   unsigned int n_samples,
                   unsigned int nthreads) {
    /* row i holds n_samples - 1 - i pairs, so equal row counts would leave
     * the first thread with most of the work. Rows are instead handed out
     * until each thread reaches its share of the pairs, while leaving at
     * least one row for every thread still to come.
     */
    const uint64_t n_pairs = (uint64_t)n_samples * (n_samples - 1) / 2;

    tasks.resize(nthreads);

    unsigned int start = 0;
    uint64_t assigned = 0;
    for(unsigned int tid = 0; tid < nthreads; tid++) {
        const uint64_t target = n_pairs * (tid + 1) / nthreads;
        const unsigned int max_stop = n_samples - (nthreads - 1 - tid);

        unsigned int stop = start;
        while(stop < max_stop && (stop == start || assigned < target)) {
            assigned += n_samples - 1 - stop;
            stop++;
        }
        if(tid == nthreads - 1)
            stop = n_samples;

        tasks[tid].tid = tid;
        tasks[tid].n_samples = n_samples;
        tasks[tid].start = start;
        tasks[tid].stop = stop;

        start = stop;
    }
}

void uw::process_rows(const std::vector<PresenceVector> &presence,
                      const std::vector<double> &lengths,
                      double* buf2d,
                      std::vector<std::thread> &threads,
                      std::vector<uw::task_parameters> &tasks) {

    // register a signal handler so we can ask the workers for their
    // progress
    register_report_status();

    for(unsigned int tid = 0; tid < threads.size(); tid++) {
        threads[tid] = std::thread(uw::unifrac,
                                   std::cref(presence),
                                   std::cref(lengths),
                                   buf2d,
                                   &tasks[tid]);
    }
    for(unsigned int tid = 0; tid < threads.size(); tid++) {
        threads[tid].join();
    }

    remove_report_status();
}
