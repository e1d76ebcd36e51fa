/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef _UWFRAC_CMD_H
#define _UWFRAC_CMD_H

#include <string>
#include <vector>
#include <algorithm>

// https://stackoverflow.com/a/868894
class InputParser {
    public:
        InputParser(int &argc, char **argv) {
            for(int i = 1; i < argc; ++i)
                this->tokens.push_back(std::string(argv[i]));
        }

        /* the value following an option, empty if the option or its value is missing */
        const std::string& getCmdOption(const std::string &option) const {
            std::vector<std::string>::const_iterator itr;
            itr = std::find(this->tokens.begin(), this->tokens.end(), option);
            if(itr != this->tokens.end() && ++itr != this->tokens.end()) {
                return *itr;
            }
            return empty_string;
        }

        bool cmdOptionExists(const std::string &option) const {
            return std::find(this->tokens.begin(), this->tokens.end(), option) != this->tokens.end();
        }

    private:
        std::vector<std::string> tokens;
        const std::string empty_string;
};

#endif
