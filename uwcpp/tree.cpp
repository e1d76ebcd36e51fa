/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#include "tree.hpp"
#include <stack>
#include <cctype>
#include <cstdlib>
#include <cmath>

using namespace uw;

BPTree::BPTree(std::string newick)
: lengths()
, names()
, nparens(0)
, structure()
, openclose()
, parents()
, select_0_index()
, select_1_index()
, valid(false)
{
    structure.reserve(newick.size());

    // three passes: topology, parentheses matching, then names and lengths
    newick_to_bp(newick);

    openclose.resize(nparens);
    parents.resize(nparens);

    if(nparens < 2 || !structure_to_openclose()) {
        // nothing downstream may index into a tree we could not match
        structure.clear();
        openclose.clear();
        parents.clear();
        nparens = 0;
        return;
    }
    valid = true;

    // resize is correct here as we are not performing a push_back
    lengths.resize(nparens);
    names.resize(nparens);
    select_0_index.resize(nparens / 2);
    select_1_index.resize(nparens / 2);

    newick_to_metadata(newick);
    index_and_cache();
}

BPTree::~BPTree() {
}

std::vector<std::string> BPTree::get_tip_names() const {
    std::vector<std::string> observed;

    for(uint32_t k = 0; k < n_nodes(); k++) {
        uint32_t node = preorderselect(k);
        if(isleaf(node))
            observed.push_back(names[node]);
    }

    return observed;
}

void BPTree::index_and_cache() {
    unsigned int idx = 0;
    auto k0 = select_0_index.begin();
    auto k1 = select_1_index.begin();

    for(auto i = structure.begin(); i != structure.end(); i++, idx++) {
        if(*i)
            *(k1++) = idx;
        else
            *(k0++) = idx;
    }
}

uint32_t BPTree::postorderselect(uint32_t k) const {
    return open(select_0_index[k]);
}

uint32_t BPTree::preorderselect(uint32_t k) const {
    return select_1_index[k];
}

inline uint32_t BPTree::open(uint32_t i) const {
    return structure[i] ? i : openclose[i];
}

bool BPTree::isleaf(uint32_t idx) const {
    return (structure[idx] && !structure[idx + 1]);
}

int32_t BPTree::parent(uint32_t i) const {
    return parents[i];
}

void BPTree::newick_to_bp(const std::string &newick) {
    char last_structure = '\0';
    bool potential_single_descendent = false;
    bool in_quote = false;
    for(auto c = newick.begin(); c != newick.end(); c++) {
        if(*c == '\'')
            in_quote = !in_quote;

        if(in_quote)
            continue;

        switch(*c) {
            case '(':
                // opening of a node
                structure.push_back(true);
                last_structure = *c;
                potential_single_descendent = true;
                break;
            case ')':
                // closing of a node
                if(potential_single_descendent || (last_structure == ',')) {
                    // we have a single descendent or a last child (i.e. ",)" scenario)
                    structure.push_back(true);
                    structure.push_back(false);
                    structure.push_back(false);
                    potential_single_descendent = false;
                } else {
                    // still possible to have a single descendent in the case of
                    // nested single descendents (e.g., (...()...) )
                    structure.push_back(false);
                }
                last_structure = *c;
                break;
            case ',':
                if(last_structure != ')') {
                    // we have a new tip
                    structure.push_back(true);
                    structure.push_back(false);
                }
                potential_single_descendent = false;
                last_structure = *c;
                break;
            default:
                break;
        }
    }
    nparens = structure.size();
}

bool BPTree::structure_to_openclose() {
    std::stack<uint32_t> oc;
    uint32_t open_idx;
    uint32_t i = 0;

    for(auto it = structure.begin(); it != structure.end(); it++, i++) {
        if(*it) {
            // a second root, e.g. "(a)(b)"
            if(oc.empty() && i > 0)
                return false;
            parents[i] = oc.empty() ? -1 : (int32_t)oc.top();
            oc.push(i);
        } else {
            if(oc.empty())
                return false;
            open_idx = oc.top();
            oc.pop();
            openclose[i] = open_idx;
            openclose[open_idx] = i;
            parents[i] = parents[open_idx];
        }
    }
    return oc.empty();
}

static inline std::string &rtrim(std::string &s) {
    std::string::size_type last = s.find_last_not_of(" \t\r\n");
    s.erase(last == std::string::npos ? 0 : last + 1);
    return s;
}

void BPTree::newick_to_metadata(std::string newick) {
    newick = rtrim(newick);

    std::string::iterator start = newick.begin();
    std::string::iterator end = newick.end();
    std::string token;
    std::string::size_type unquoted_from;
    char last_structure = '\0';

    unsigned int structure_idx = 0;
    unsigned int lag = 0;
    unsigned int open_idx;

    while(start != end) {
        token = tokenize(start, end, unquoted_from);
        if(token.empty())
            break;

        if(token.length() == 1 && is_structure_character(token[0])) {
            switch(token[0]) {
                case '(':
                    structure_idx++;
                    break;
                case ')':
                case ',':
                    structure_idx++;
                    if(last_structure == ')')
                        lag++;
                    break;
            }
        } else {
            // puts us on the corresponding closing parenthesis
            structure_idx += lag;
            lag = 0;

            if(structure_idx >= nparens)
                break;

            open_idx = open(structure_idx);
            set_node_metadata(open_idx, token, unquoted_from);

            // a leaf is by definition a 10, so a single advancement would
            // put the structure to token mapping out of sync
            if(isleaf(open_idx))
                structure_idx += 2;
            else
                structure_idx += 1;
        }
        last_structure = token[0];
    }
}

void BPTree::set_node_metadata(unsigned int open_idx, std::string &token, std::string::size_type unquoted_from) {
    double length = 0.0;
    std::string name = token;
    std::string::size_type colon_idx = token.find_last_of(':');

    // a colon inside quotes is part of the name
    if(colon_idx != std::string::npos && colon_idx >= unquoted_from) {
        std::string length_str = token.substr(colon_idx + 1);
        char *parsed_end = NULL;
        double parsed = strtod(length_str.c_str(), &parsed_end);

        // an unquoted colon without a length is part of the name
        if(!length_str.empty() && *parsed_end == '\0') {
            if(!std::isfinite(parsed)) {
                valid = false;
                return;
            }
            name = token.substr(0, colon_idx);
            length = parsed > 0.0 ? parsed : 0.0;
        }
    }

    names[open_idx] = name;
    lengths[open_idx] = length;
}

inline bool BPTree::is_structure_character(char c) const {
    return (c == '(' || c == ')' || c == ',' || c == ';');
}

std::string BPTree::tokenize(std::string::iterator &start, const std::string::iterator &end,
                             std::string::size_type &unquoted_from) {
    bool inquote = false;
    bool isquote = false;
    char c;
    std::string token;

    unquoted_from = 0;

    do {
        c = *start;
        start++;

        isquote = c == '\'';

        if(inquote && isquote) {
            inquote = false;
            unquoted_from = token.length();
            continue;
        } else if(!inquote && isquote) {
            inquote = true;
            continue;
        }

        if(!inquote && std::isspace(static_cast<unsigned char>(c)))
            continue;

        if(is_structure_character(c) && !inquote) {
            if(token.length() == 0)
                token.push_back(c);
            break;
        }

        token.push_back(c);

    } while(start != end);

    return token;
}

std::vector<bool> BPTree::get_structure() const {
    return structure;
}

std::vector<uint32_t> BPTree::get_openclose() const {
    return openclose;
}
