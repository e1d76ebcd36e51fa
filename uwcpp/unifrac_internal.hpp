/*
 * BSD 3-Clause License
 *
 * Copyright (c) 2016-2021, UniFrac development team.
 * All rights reserved.
 *
 * See LICENSE file for more details
 */

#ifndef __UWFRAC_INTERNAL
#define __UWFRAC_INTERNAL 1

#include "task_parameters.hpp"

namespace uw {
 // helper reporting functions
 void register_report_status();
 void remove_report_status();
 void try_report(const uw::task_parameters* task_p, unsigned int k, unsigned int max_k);

 // printf, serialized across worker threads
 int sync_printf(const char *format, ...);
}

#endif
