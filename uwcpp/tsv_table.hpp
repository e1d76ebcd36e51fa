/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */


#ifndef _UWFRAC_TSV_TABLE_H
#define _UWFRAC_TSV_TABLE_H

#include <iosfwd>
#include <vector>
#include <unordered_map>

#include "table_interface.hpp"

namespace uw {
    /* A tab-delimited sample-feature table
     *
     * The first line holds the sample names; its first field is ignored.
     * Every following line is a taxon name followed by one value per sample:
     *
     *     #OTU ID  SampleA  SampleB  SampleC
     *     T1       10       0        5
     *     T2       0        25       0
     *
     * Values that do not parse as a number are read as zero. A taxon that
     * is listed twice makes the table invalid.
     */
    class tsv_table : public table_interface {
        public:
            /* default constructor
             *
             * @param filename The path to the table to read
             */
            tsv_table(std::string filename);

            virtual ~tsv_table();

            bool has_obs(const std::string &id) const;

            void get_obs_data(const std::string &id, double* out) const;

        private:
            /* dense row-major values, n_obs x n_samples */
            std::vector<double> data;

            std::unordered_map<std::string, uint32_t> obs_id_index;

            void parse(std::istream &input);
    };
}

#endif /* _UWFRAC_TSV_TABLE_H */
