#include <stdint.h>

#ifndef __uw_task_parameters
    #ifdef __cplusplus
    namespace uw {
    #endif

        /* task specific compute parameters
         *
         * n_samples <uint> the number of samples being processed
         * start <uint> the first row of the distance matrix to process
         * stop <uint> one past the last row to process
         * tid <uint> the thread identifier
         *
         * A task owns the cells (i, j) and (j, i) for start <= i < stop
         * and j >= i.
         */
        struct task_parameters {
           uint32_t n_samples;          // number of samples
           unsigned int start;          // starting row
           unsigned int stop;           // stopping row
           unsigned int tid;            // thread ID
        };

    #ifdef __cplusplus
    }
    #endif

#define __uw_task_parameters
#endif
