/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */


#ifndef _UWFRAC_BIOM_H
#define _UWFRAC_BIOM_H

#include <H5Cpp.h>
#include <vector>
#include <unordered_map>

#include "table_interface.hpp"

namespace uw {
    class biom : public table_interface {
        public:
            /* default constructor
             *
             * @param filename The path to the BIOM table to read
             */
            biom(std::string filename);

            virtual ~biom();

            bool has_obs(const std::string &id) const;

            /* get a dense vector of observation data
             *
             * @param id The observation ID to fetch
             * @param out An allocated array of at least size n_samples.
             *      Values of an index position [0, n_samples) which do not
             *      have data will be zero'd.
             */
            void get_obs_data(const std::string &id, double* out) const;

            /* test whether a file is an HDF5 container, and thus a BIOM 2.x candidate */
            static bool is_biom(const std::string &filename);

        private:
            H5::H5File file;

            /* the observation axis, CSR; row i spans [obs_indptr[i], obs_indptr[i + 1]) */
            std::vector<uint32_t> obs_indptr;
            std::vector<uint32_t> obs_indices;
            std::vector<double> obs_data;

            /* At construction, lookups mapping IDs -> index position within an
             * axis are defined
             */
            std::unordered_map<std::string, uint32_t> obs_id_index;

            /* load ids from an axis
             *
             * @param path The dataset path to the ID dataset to load
             * @param ids The variable representing the IDs to load into
             */
            void load_ids(const char *path, std::vector<std::string> &ids);

            /* load a one dimensional numeric dataset
             *
             * @param path The dataset path to load
             * @param mem_type The in-memory type HDF5 converts into
             * @param out The vector to load the data into
             */
            template<class T> void load_dataset(const char *path, const H5::PredType &mem_type, std::vector<T> &out);

            /* verify the CSR arrays describe n_obs rows over n_samples columns */
            bool check_obs_axis() const;

            /* create an index mapping an ID to its corresponding index
             * position.
             *
             * @param ids A vector of IDs to index
             * @param map A hash table to populate
             * @return The first ID found more than once, empty if IDs are unique
             */
            std::string create_id_index(const std::vector<std::string> &ids,
                                 std::unordered_map<std::string, uint32_t> &map);
    };
}

#endif /* _UWFRAC_BIOM_H */
