/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include <fstream>
#include <sstream>
#include <cstdlib>
#include <stdio.h>
#include "tsv_table.hpp"

using namespace uw;

static std::vector<std::string> split_tabs(const std::string &line) {
    std::vector<std::string> fields;
    std::string field;
    std::istringstream stream(line);

    while(std::getline(stream, field, '\t'))
        fields.push_back(field);

    // getline drops an empty trailing field
    if(!line.empty() && line[line.size() - 1] == '\t')
        fields.push_back(std::string());

    return fields;
}

static inline void strip_cr(std::string &line) {
    if(!line.empty() && line[line.size() - 1] == '\r')
        line.erase(line.size() - 1);
}

static double parse_value(const std::string &field) {
    char *end = NULL;
    double value = strtod(field.c_str(), &end);
    if(end == field.c_str())
        return 0.0;
    return value;
}

tsv_table::tsv_table(std::string filename)
: table_interface()
, data()
, obs_id_index()
{
    std::ifstream input(filename.c_str());
    if(!input.good()) {
        valid = false;
        return;
    }
    parse(input);
}

tsv_table::~tsv_table() {
}

void tsv_table::parse(std::istream &input) {
    std::string line;

    if(!std::getline(input, line)) {
        // no header, and thus no samples
        return;
    }
    strip_cr(line);

    std::vector<std::string> header = split_tabs(line);
    for(size_t i = 1; i < header.size(); i++)
        sample_ids.push_back(header[i]);
    n_samples = sample_ids.size();

    unsigned int line_no = 1;
    while(std::getline(input, line)) {
        line_no++;
        strip_cr(line);
        if(line.empty())
            continue;

        std::vector<std::string> fields = split_tabs(line);
        if(fields.size() != (size_t)n_samples + 1) {
            fprintf(stderr, "Line %u has %zu values, expected %u\n",
                    line_no, fields.size() - 1, n_samples);
            valid = false;
            return;
        }

        uint32_t row = obs_ids.size();
        if(!obs_id_index.insert(std::make_pair(fields[0], row)).second) {
            fprintf(stderr, "Line %u repeats observation %s\n", line_no, fields[0].c_str());
            valid = false;
            return;
        }
        obs_ids.push_back(fields[0]);
        data.resize(data.size() + n_samples, 0.0);

        double *values = data.data() + (size_t)row * n_samples;
        for(uint32_t j = 0; j < n_samples; j++)
            values[j] = parse_value(fields[j + 1]);
    }
    n_obs = obs_ids.size();
}

bool tsv_table::has_obs(const std::string &id) const {
    return obs_id_index.count(id) > 0;
}

void tsv_table::get_obs_data(const std::string &id, double* out) const {
    uint32_t idx = obs_id_index.at(id);
    const double *values = data.data() + (size_t)idx * n_samples;

    for(unsigned int i = 0; i < n_samples; i++)
        out[i] = values[i];
}
