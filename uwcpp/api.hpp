/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include "task_parameters.hpp"

#ifdef __cplusplus
#include <string>
#include <vector>
#define EXTERN extern "C"


#else
#include <stdbool.h>
#define EXTERN
#endif

#define UWFRAC_HDF5_FORMAT "BDSM"
#define UWFRAC_HDF5_VERSION "2020.12"


typedef enum compute_status {okay=0, tree_missing, table_missing, table_empty, tree_malformed, table_malformed,
                             duplicate_tip_names, unknown_format, output_error, crosscheck_mismatch} ComputeStatus;
typedef enum io_status {read_okay=0, write_okay, open_error, read_error, write_error} IOStatus;

/* a result matrix, full, fp64
 *
 * n_samples <uint> the number of samples.
 * flags <uint> opaque, 0 for default behavior.
 * matrix <double*> the matrix values, n_sample**2 size
 * sample_ids <char**> the sample IDs of length n_samples.
 */
typedef struct mat_full_fp64 {
    uint32_t n_samples;
    uint32_t flags; //opaque, 0 for default behavior
    double* matrix;
    char** sample_ids;
} mat_full_fp64_t;


EXTERN void destroy_mat_full_fp64(mat_full_fp64_t** result);

/* Compute unweighted UniFrac - matrix form
 *
 * table_filename <const char*> the filename to the table, BIOM (HDF5) or tab delimited.
 * tree_filename <const char*> the filename to the correspodning tree.
 * nthreads <uint> the number of threads to use.
 * verify <bool> recompute every distance with the matrix product form and compare.
 * result <mat_full_fp64_t**> the resulting distance matrix in matrix form, this is initialized within the method so using **
 *
 * one_off_matrix returns the following error codes:
 *
 * okay                : no problems encountered
 * table_missing       : the filename for the table does not exist
 * tree_missing        : the filename for the tree does not exist
 * tree_malformed      : the newick could not be parsed into a single rooted tree, or has a non-finite length
 * table_malformed     : the table could not be parsed, or lists an observation twice
 * table_empty         : the table does not have any samples or observations
 * duplicate_tip_names : a tip name occurs more than once in the tree
 * crosscheck_mismatch : verify was requested and the two formulations disagree
 */
EXTERN ComputeStatus one_off_matrix(const char* table_filename, const char* tree_filename,
                                    unsigned int nthreads, bool verify,
                                    mat_full_fp64_t** result);

/* Compute unweighted UniFrac and save to file
 *
 * table_filename <const char*> the filename to the table.
 * tree_filename <const char*> the filename to the correspodning tree.
 * out_filename <const char*> the filename of the output file.
 * nthreads <uint> the number of threads to use.
 * verify <bool> recompute every distance with the matrix product form and compare.
 * format <const char*> output format to use, ascii or hdf5.
 *
 * unifrac_to_file returns the error codes of one_off_matrix, as well as
 *
 * unknown_format : the requested format is unknown.
 * output_error   : failure writing the output file
 */
EXTERN ComputeStatus unifrac_to_file(const char* table_filename, const char* tree_filename, const char* out_filename,
                                     unsigned int nthreads, bool verify, const char* format);

/* Write a matrix object
 *
 * filename <const char*> the file to write into
 * result <mat_full_fp64_t*> the results object
 *
 * The following error codes are returned:
 *
 * write_okay : no problems
 * open_error : the output file could not be opened
 * write_error : the output file could not be completely written
 */
EXTERN IOStatus write_mat_from_matrix(const char* filename, mat_full_fp64_t* result);

/* Write a matrix object using hdf5 format
 *
 * filename <const char*> the file to write into
 * result <mat_full_fp64_t*> the results object
 *
 * The following error codes are returned:
 *
 * write_okay : no problems
 * write_error : problems writing
 */
EXTERN IOStatus write_mat_from_matrix_hdf5(const char* filename, mat_full_fp64_t* result);

#ifdef __cplusplus
// allocate a result for the given samples, matrix values are uninitialized
void initialize_mat_full(mat_full_fp64_t* &result, const std::vector<std::string> &sample_ids);
#endif
