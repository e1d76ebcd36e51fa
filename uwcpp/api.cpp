/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include "api.hpp"
#include "biom.hpp"
#include "tsv_table.hpp"
#include "tree.hpp"
#include "edge_index.hpp"
#include "presence.hpp"
#include "unifrac.hpp"
#include "crosscheck.hpp"
#include <fstream>
#include <iomanip>
#include <memory>
#include <thread>
#include <cstring>
#include <stdlib.h>

// the number of unknown observation IDs listed in a warning
#define UWFRAC_MAX_REPORTED_IDS 5


#define CHECK_FILE(filename, err) if(!is_file_exists(filename)) { \
                                      return err;                 \
                                  }

#define PARSE_SYNC_TREE_TABLE(tree_filename, table_filename) std::ifstream ifs(tree_filename);                                        \
                                                             std::string content = std::string(std::istreambuf_iterator<char>(ifs),   \
                                                                                               std::istreambuf_iterator<char>());     \
                                                             uw::BPTree tree(content);                                                \
                                                             compute_status tree_status = check_tree(tree);                           \
                                                             if(tree_status != okay) {                                                \
                                                                 return tree_status;                                                  \
                                                             }                                                                        \
                                                             std::unique_ptr<uw::table_interface> table;                              \
                                                             compute_status table_status = load_table(table_filename, table);         \
                                                             if(table_status != okay) {                                               \
                                                                 return table_status;                                                 \
                                                             }                                                                        \
                                                             uw::EdgeIndex edges(tree);                                               \
                                                             warn_unknown_ids(*table, edges);


using namespace uw;
using namespace std;

// https://stackoverflow.com/a/19841704/19741
bool is_file_exists(const char *fileName) {
    std::ifstream infile(fileName);
        return infile.good();
}

compute_status check_tree(const BPTree &tree) {
    if(!tree.is_valid()) {
        fprintf(stderr, "The tree is not a single rooted newick tree with finite branch lengths\n");
        return tree_malformed;
    }

    std::string duplicate = uw::find_duplicate_tip_name(tree);
    if(!duplicate.empty()) {
        fprintf(stderr, "Tip name %s occurs more than once in the tree\n", duplicate.c_str());
        return duplicate_tip_names;
    }

    return okay;
}

compute_status load_table(const char* table_filename, std::unique_ptr<uw::table_interface> &table) {
    try {
        if(uw::biom::is_biom(table_filename))
            table.reset(new uw::biom(table_filename));
        else
            table.reset(new uw::tsv_table(table_filename));
    } catch(const H5::Exception &e) {
        fprintf(stderr, "Unable to read the BIOM table %s: %s\n", table_filename, e.getCDetailMsg());
        return table_malformed;
    }

    if(!table->is_valid())
        return table_malformed;

    if(table->n_samples == 0 || table->n_obs == 0)
        return table_empty;

    return okay;
}

void warn_unknown_ids(const uw::table_interface &table, const uw::EdgeIndex &edges) {
    std::vector<std::string> unknown = uw::table_ids_not_in_tree(table, edges);
    if(unknown.empty())
        return;

    fprintf(stderr, "WARNING: %zu table observation(s) are not tips of the tree and will be ignored:",
            unknown.size());
    for(size_t i = 0; i < unknown.size() && i < UWFRAC_MAX_REPORTED_IDS; i++)
        fprintf(stderr, " %s", unknown[i].c_str());
    if(unknown.size() > UWFRAC_MAX_REPORTED_IDS)
        fprintf(stderr, " ...");
    fprintf(stderr, "\n");
}

void initialize_mat_full(mat_full_fp64_t* &result, const std::vector<std::string> &sample_ids) {
    result = (mat_full_fp64_t*)malloc(sizeof(mat_full_fp64_t));
    if(result == NULL)
        return;

    result->n_samples = sample_ids.size();
    result->flags = 0;

    uint64_t n_samples_64 = result->n_samples; // force 64bit to avoid overflow problems

    result->sample_ids = (char**)malloc(sizeof(char*) * n_samples_64);
    result->matrix = (double*)malloc(sizeof(double) * n_samples_64 * n_samples_64);

    if(result->sample_ids == NULL)
        return;

    for(unsigned int i = 0; i < result->n_samples; i++) {
        result->sample_ids[i] = strdup(sample_ids[i].c_str());
    }
}

void destroy_mat_full_fp64(mat_full_fp64_t** result) {
    if((*result) == NULL)
        return;

    if(((*result)->sample_ids) != NULL) {
        for(uint32_t i = 0; i < (*result)->n_samples; i++) {
            free((*result)->sample_ids[i]);
        };
        free((*result)->sample_ids);
    }
    if(((*result)->matrix) != NULL) {
        free((*result)->matrix);
        (*result)->matrix = NULL;
    }
    free(*result);
    *result = NULL;
}

compute_status one_off_matrix(const char* table_filename, const char* tree_filename,
                              unsigned int nthreads, bool verify,
                              mat_full_fp64_t** result) {
    CHECK_FILE(table_filename, table_missing)
    CHECK_FILE(tree_filename, tree_missing)
    PARSE_SYNC_TREE_TABLE(tree_filename, table_filename)

    const unsigned int n_samples = table->n_samples;

    std::vector<uw::PresenceVector> presence;
    uw::make_presence_vectors(*table, edges, presence);

    initialize_mat_full(*result, table->sample_ids);
    if(((*result) == NULL) || ((*result)->matrix == NULL) || ((*result)->sample_ids == NULL)) {
        fprintf(stderr, "Memory allocation error! (initialize_mat_full)\n");
        exit(EXIT_FAILURE);
    }

    if(nthreads == 0)
        nthreads = 1;
    if(nthreads > n_samples) {
        fprintf(stderr, "WARNING: Using %u threads instead of %u, there are only %u samples\n",
                n_samples, nthreads, n_samples);
        nthreads = n_samples;
    }

    std::vector<uw::task_parameters> tasks(nthreads);
    std::vector<std::thread> threads(nthreads);

    uw::set_tasks(tasks, n_samples, nthreads);
    uw::process_rows(presence, edges.lengths, (*result)->matrix, threads, tasks);

    if(verify) {
        uint64_t mismatches = uw::crosscheck_matrix(*table, edges, presence, (*result)->matrix);
        if(mismatches > 0) {
            fprintf(stderr, "Direct and matrix product forms disagree on %llu value(s)\n",
                    (unsigned long long)mismatches);
            destroy_mat_full_fp64(result);
            return crosscheck_mismatch;
        }
    }

    return okay;
}

compute_status unifrac_to_file(const char* table_filename, const char* tree_filename, const char* out_filename,
                               unsigned int nthreads, bool verify, const char* format) {
    const std::string format_string = format == NULL ? "" : format;

    bool use_hdf5;
    if(format_string.empty() || format_string == "ascii")
        use_hdf5 = false;
    else if(format_string == "hdf5")
        use_hdf5 = true;
    else
        return unknown_format;

    mat_full_fp64_t* result = NULL;
    compute_status rc = one_off_matrix(table_filename, tree_filename, nthreads, verify, &result);

    if(rc == okay) {
        IOStatus iostatus;
        if(use_hdf5)
            iostatus = write_mat_from_matrix_hdf5(out_filename, result);
        else
            iostatus = write_mat_from_matrix(out_filename, result);
        destroy_mat_full_fp64(&result);

        if(iostatus != write_okay) rc = output_error;
    }

    return rc;
}

IOStatus write_mat_from_matrix(const char* output_filename, mat_full_fp64_t* result) {
    const double *buf2d = result->matrix;

    std::ofstream output;
    output.open(output_filename);
    if(!output.is_open())
        return open_error;

    double v;
    const uint64_t n_samples_64 = result->n_samples; // 64-bit to avoid overflow

    for(unsigned int i = 0; i < result->n_samples; i++)
        output << "\t" << result->sample_ids[i];
    output << std::endl;

    for(unsigned int i = 0; i < result->n_samples; i++) {
        output << result->sample_ids[i];
        for(unsigned int j = 0; j < result->n_samples; j++) {
            v = buf2d[i*n_samples_64+j];
            output << std::setprecision(16) << "\t" << v;
        }
        output << std::endl;
    }
    output.close();

    if(output.fail())
        return write_error;

    return write_okay;
}

herr_t write_hdf5_string(hid_t output_file_id, const char *dname, const char *str)
{
    // stored in FORTRAN form, so readers do not depend on null termination
    hid_t filetype_id = H5Tcopy(H5T_FORTRAN_S1);
    H5Tset_size(filetype_id, strlen(str));
    hid_t memtype_id = H5Tcopy(H5T_C_S1);
    H5Tset_size(memtype_id, strlen(str)+1);

    hsize_t dims[1] = {1};
    hid_t dataspace_id = H5Screate_simple(1, dims, NULL);

    herr_t status = -1;
    hid_t dataset_id = H5Dcreate2(output_file_id, dname, filetype_id, dataspace_id,
                                  H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
    if(dataset_id >= 0) {
        status = H5Dwrite(dataset_id, memtype_id, H5S_ALL, H5S_ALL, H5P_DEFAULT, str);
        H5Dclose(dataset_id);
    }

    H5Sclose(dataspace_id);
    H5Tclose(memtype_id);
    H5Tclose(filetype_id);

    return status;
}

IOStatus write_mat_from_matrix_hdf5(const char* output_filename, mat_full_fp64_t* result) {
    /* Create a new file using default properties. */
    hid_t output_file_id = H5Fcreate(output_filename, H5F_ACC_TRUNC, H5P_DEFAULT, H5P_DEFAULT);
    if(output_file_id < 0) return write_error;

    // simple header
    if(write_hdf5_string(output_file_id, "format", UWFRAC_HDF5_FORMAT) < 0) {
        H5Fclose(output_file_id);
        return write_error;
    }
    if(write_hdf5_string(output_file_id, "version", UWFRAC_HDF5_VERSION) < 0) {
        H5Fclose(output_file_id);
        return write_error;
    }

    // save the ids
    {
        hsize_t dims[1];
        dims[0] = result->n_samples;
        hid_t dataspace_id = H5Screate_simple(1, dims, NULL);

        // variable length strings, one per sample
        hid_t datatype_id = H5Tcopy(H5T_C_S1);
        H5Tset_size(datatype_id, H5T_VARIABLE);

        herr_t status = -1;
        hid_t dataset_id = H5Dcreate2(output_file_id, "order", datatype_id, dataspace_id,
                                      H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        if(dataset_id >= 0) {
            status = H5Dwrite(dataset_id, datatype_id, H5S_ALL, H5S_ALL,
                              H5P_DEFAULT, result->sample_ids);
            H5Dclose(dataset_id);
        }

        H5Tclose(datatype_id);
        H5Sclose(dataspace_id);

        // check status after cleanup, for simplicity
        if(status < 0) {
            H5Fclose(output_file_id);
            return write_error;
        }
    }

    // save the matrix
    {
        hsize_t dims[2];
        dims[0] = result->n_samples;
        dims[1] = result->n_samples;
        hid_t dataspace_id = H5Screate_simple(2, dims, NULL);

        herr_t status = -1;
        hid_t dataset_id = H5Dcreate2(output_file_id, "matrix", H5T_IEEE_F64LE, dataspace_id,
                                      H5P_DEFAULT, H5P_DEFAULT, H5P_DEFAULT);
        if(dataset_id >= 0) {
            status = H5Dwrite(dataset_id, H5T_NATIVE_DOUBLE, H5S_ALL, H5S_ALL, H5P_DEFAULT,
                              result->matrix);
            H5Dclose(dataset_id);
        }

        H5Sclose(dataspace_id);

        // check status after cleanup, for simplicity
        if(status < 0) {
            H5Fclose(output_file_id);
            return write_error;
        }
    }

    if(H5Fclose(output_file_id) < 0)
        return write_error;

    return write_okay;
}
