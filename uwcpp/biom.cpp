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
#include "biom.hpp"

using namespace H5;
using namespace uw;

/* datasets defined by the BIOM 2.x spec */
const std::string OBS_INDPTR = std::string("/observation/matrix/indptr");
const std::string OBS_INDICES = std::string("/observation/matrix/indices");
const std::string OBS_DATA = std::string("/observation/matrix/data");
const std::string OBS_IDS = std::string("/observation/ids");
const std::string SAMPLE_IDS = std::string("/sample/ids");

biom::biom(std::string filename)
: table_interface()
, file(filename.c_str(), H5F_ACC_RDONLY)
, obs_indptr()
, obs_indices()
, obs_data()
, obs_id_index()
{
    load_ids(OBS_IDS.c_str(), obs_ids);
    load_ids(SAMPLE_IDS.c_str(), sample_ids);

    n_samples = sample_ids.size();
    n_obs = obs_ids.size();

    load_dataset(OBS_INDPTR.c_str(), PredType::NATIVE_UINT32, obs_indptr);
    load_dataset(OBS_INDICES.c_str(), PredType::NATIVE_UINT32, obs_indices);
    load_dataset(OBS_DATA.c_str(), PredType::NATIVE_DOUBLE, obs_data);

    valid = check_obs_axis();
    if(!valid) {
        fprintf(stderr, "Inconsistent observation matrix in %s\n", filename.c_str());
        return;
    }

    std::string duplicate = create_id_index(obs_ids, obs_id_index);
    if(!duplicate.empty()) {
        fprintf(stderr, "Observation %s is listed more than once in %s\n",
                duplicate.c_str(), filename.c_str());
        valid = false;
    }
}

bool biom::check_obs_axis() const {
    if(obs_indptr.size() != (size_t)n_obs + 1 || obs_indices.size() != obs_data.size())
        return false;
    if(obs_indptr[0] != 0 || obs_indptr[n_obs] != obs_indices.size())
        return false;
    for(uint32_t i = 0; i < n_obs; i++) {
        if(obs_indptr[i] > obs_indptr[i + 1])
            return false;
    }
    for(auto it = obs_indices.begin(); it != obs_indices.end(); it++) {
        if(*it >= n_samples)
            return false;
    }
    return true;
}

biom::~biom() {
}

bool biom::is_biom(const std::string &filename) {
    // isHdf5 raises on a missing file rather than answering false
    try {
        return H5File::isHdf5(filename.c_str());
    } catch(const FileIException &e) {
        return false;
    }
}

void biom::load_ids(const char *path, std::vector<std::string> &ids) {
    DataSet ds_ids = file.openDataSet(path);
    DataSpace dataspace = ds_ids.getSpace();

    hsize_t dims[1];
    dataspace.getSimpleExtentDims(dims, NULL);

    /* the IDs are a dataset of variable length strings */
    StrType dtype(PredType::C_S1, H5T_VARIABLE);
    std::vector<char*> dataout(dims[0]);
    if(dims[0] > 0)
        ds_ids.read((void*)dataout.data(), dtype);

    ids.reserve(dims[0]);
    for(unsigned int i = 0; i < dims[0]; i++) {
        ids.push_back(dataout[i]);
        free(dataout[i]);
    }
}

template<class T>
void biom::load_dataset(const char *path, const PredType &mem_type, std::vector<T> &out) {
    DataSet ds = file.openDataSet(path);
    DataSpace dataspace = ds.getSpace();

    hsize_t dims[1];
    dataspace.getSimpleExtentDims(dims, NULL);

    out.resize(dims[0]);
    if(dims[0] > 0)
        ds.read((void*)out.data(), mem_type);
}

std::string biom::create_id_index(const std::vector<std::string> &ids,
                                  std::unordered_map<std::string, uint32_t> &map) {
    uint32_t count = 0;
    map.reserve(ids.size());
    for(auto i = ids.begin(); i != ids.end(); i++, count++) {
        if(!map.insert(std::make_pair(*i, count)).second)
            return *i;
    }
    return "";
}

bool biom::has_obs(const std::string &id) const {
    return obs_id_index.count(id) > 0;
}

void biom::get_obs_data(const std::string &id, double* out) const {
    uint32_t idx = obs_id_index.at(id);
    uint32_t start = obs_indptr[idx];
    uint32_t end = obs_indptr[idx + 1];

    // reset our output buffer
    for(unsigned int i = 0; i < n_samples; i++)
        out[i] = 0.0;

    for(uint32_t i = start; i < end; i++) {
        out[obs_indices[i]] = obs_data[i];
    }
}
