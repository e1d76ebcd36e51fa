/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <iostream>
#include <string>
#include <cstdlib>
#include <stdio.h>
#include <signal.h>
#include "api.hpp"
#include "cmd.hpp"

enum Format {format_invalid, format_ascii, format_hdf5};

void usage() {
    std::cout << "usage: uwfrac -i <table> -o <out.dm> -t <newick> [-n threads] [--format|-r out-mode] [--verify]" << std::endl;
    std::cout << std::endl;
    std::cout << "    -i\t\tThe input table, BIOM (HDF5) or tab delimited with samples as columns." << std::endl;
    std::cout << "    -t\t\tThe input phylogeny in newick." << std::endl;
    std::cout << "    -o\t\tThe output distance matrix." << std::endl;
    std::cout << "    -n\t\t[OPTIONAL] The number of threads, default is 1." << std::endl;
    std::cout << "    --format|-r\t[OPTIONAL]  Output format:" << std::endl;
    std::cout << "    \t\t    ascii : [DEFAULT] Tab delimited labeled matrix." << std::endl;
    std::cout << "    \t\t    hdf5 : HDF5 format, fp64." << std::endl;
    std::cout << "    --verify\t[OPTIONAL] Recompute every distance through the edge by leaf" << std::endl;
    std::cout << "    \t\t    presence matrix and fail if the two computations disagree." << std::endl;
    std::cout << std::endl;
    std::cout << "Citations: " << std::endl;
    std::cout << "    For UniFrac, please see:" << std::endl;
    std::cout << "        Lozupone and Knight Appl Environ Microbiol 2005; DOI: 10.1128/AEM.71.12.8228-8235.2005" << std::endl;
    std::cout << "        Lozupone et al. Appl Environ Microbiol 2007; DOI: 10.1128/AEM.01996-06" << std::endl;
    std::cout << "        Hamady et al. ISME 2010; DOI: 10.1038/ismej.2009.97" << std::endl;
    std::cout << "        Lozupone et al. ISME 2011; DOI: 10.1038/ismej.2010.133" << std::endl;
    std::cout << std::endl;
    std::cout << "Runtime progress can be obtained by issuing a SIGUSR1 signal. If running with " << std::endl;
    std::cout << "multiple threads, this signal will only be honored if issued to the master PID. " << std::endl;
    std::cout << "The report will yield the following information: " << std::endl;
    std::cout << std::endl;
    std::cout << "tid:<thread ID> start:<starting row> stop:<stopping row> k:<rows completed> total:<number of rows>" << std::endl;
    std::cout << std::endl;
    std::cout << "The proportion of the work of a thread that is done can be estimated from (k / total)." << std::endl;
    std::cout << std::endl;
}

const char* compute_status_messages[10] = {"No error.",
                                           "The tree file cannot be found.",
                                           "The table file cannot be found.",
                                           "The table file contains an empty table.",
                                           "The tree file does not contain a single rooted newick tree with finite branch lengths.",
                                           "The table file cannot be parsed.",
                                           "The tree contains duplicate tip names.",
                                           "An unknown output format was requested.",
                                           "Error creating the output.",
                                           "The direct and matrix product computations disagree."};


void err(std::string msg) {
    std::cerr << "ERROR: " << msg << std::endl << std::endl;
    usage();
}

int mode_one_off(const std::string &table_filename, const std::string &tree_filename,
                 const std::string &output_filename, const std::string &format_str,
                 unsigned int nthreads, bool verify) {
    if(output_filename.empty()) {
        err("output filename missing");
        return EXIT_FAILURE;
    }

    if(table_filename.empty()) {
        err("table filename missing");
        return EXIT_FAILURE;
    }

    if(tree_filename.empty()) {
        err("tree filename missing");
        return EXIT_FAILURE;
    }

    compute_status status = unifrac_to_file(table_filename.c_str(), tree_filename.c_str(), output_filename.c_str(),
                                            nthreads, verify, format_str.c_str());

    if(status != okay) {
        fprintf(stderr, "Compute failed in one_off: %s\n", compute_status_messages[status]);
    }

    return (status == okay) ? EXIT_SUCCESS : EXIT_FAILURE;
}

void uw_sig_handler(int signo) {
    if (signo == SIGUSR1) {
        printf("Status cannot be reported.\n");
    }
}

Format get_format(const std::string &format_string) {
    Format format_val = format_invalid;
    if (format_string.empty()) {
        format_val = format_ascii;
    } else if (format_string == "ascii") {
        format_val = format_ascii;
    } else if (format_string == "hdf5") {
        format_val = format_hdf5;
    }

    return format_val;
}

int main(int argc, char **argv){
    signal(SIGUSR1, uw_sig_handler);
    InputParser input(argc, argv);
    if(input.cmdOptionExists("-h") || input.cmdOptionExists("--help") || argc == 1) {
        usage();
        return EXIT_SUCCESS;
    }

    unsigned int nthreads;
    std::string table_filename = input.getCmdOption("-i");
    std::string tree_filename = input.getCmdOption("-t");
    std::string output_filename = input.getCmdOption("-o");
    std::string nthreads_arg = input.getCmdOption("-n");
    std::string format_arg = input.getCmdOption("--format");
    std::string sformat_arg = input.getCmdOption("-r");

    if(nthreads_arg.empty()) {
        nthreads = 1;
    } else {
        int requested = atoi(nthreads_arg.c_str());
        if(requested < 1) {
            err("-n must be a positive number of threads");
            return EXIT_FAILURE;
        }
        nthreads = requested;
    }

    bool verify = input.cmdOptionExists("--verify");

    if(format_arg.empty()) {
        format_arg = sformat_arg; // easier to use a single variable
    }
    if(get_format(format_arg) == format_invalid) {
        err("Invalid format, must be one of ascii|hdf5");
        return EXIT_FAILURE;
    }

    return mode_one_off(table_filename, tree_filename, output_filename, format_arg, nthreads, verify);
}
