/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2021-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */


#ifndef _UWFRAC_TABLE_INTERFACE_H
#define _UWFRAC_TABLE_INTERFACE_H

#include <vector>
#include <string>
#include <stdint.h>

namespace uw {
    class table_interface {
        public:
            // cache the IDs contained within the table
            std::vector<std::string> sample_ids;
            std::vector<std::string> obs_ids;

            uint32_t n_samples;  // the number of samples
            uint32_t n_obs;      // the number of observations

            /* default constructor
             *
             * All initialization happens in children constructors.
             */
            table_interface() : sample_ids(), obs_ids(), n_samples(0), n_obs(0), valid(true) {}

            virtual ~table_interface() {}

            /* false if the table could be opened but its content is inconsistent */
            bool is_valid() const { return valid; }

            /* test if an observation is present in the table
             *
             * @param id The observation ID to look for
             */
            virtual bool has_obs(const std::string &id) const = 0;

            /* get a dense vector of observation data
             *
             * @param id The observation ID to fetch
             * @param out An allocated array of at least size n_samples.
             *      Values of an index position [0, n_samples) which do not
             *      have data will be zero'd.
             */
            virtual void get_obs_data(const std::string &id, double* out) const = 0;

        protected:
            bool valid;
    };
}

#endif /* _UWFRAC_TABLE_INTERFACE_H */
