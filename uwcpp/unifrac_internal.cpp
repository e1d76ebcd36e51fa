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
#include <signal.h>
#include <stdarg.h>
#include <pthread.h>

#include "unifrac_internal.hpp"

// the number of worker threads which can be asked for a report
#define UWFRAC_MAX_REPORTERS 1024

static pthread_mutex_t printf_mutex = PTHREAD_MUTEX_INITIALIZER;
static volatile sig_atomic_t* report_status = NULL;
static void (*previous_handler)(int) = SIG_DFL;

int uw::sync_printf(const char *format, ...) {
    // https://stackoverflow.com/a/23587285/19741
    va_list args;
    va_start(args, format);

    pthread_mutex_lock(&printf_mutex);
    int rc = vprintf(format, args);
    fflush(stdout);
    pthread_mutex_unlock(&printf_mutex);

    va_end(args);
    return rc;
}

static void sig_handler(int signo) {
    // http://www.thegeekstuff.com/2012/03/catch-signals-sample-c-code
    if (signo == SIGUSR1) {
        if(report_status != NULL) {
            for(int i = 0; i < UWFRAC_MAX_REPORTERS; i++) {
                report_status[i] = 1;
            }
        }
    }
}

using namespace uw;

void uw::try_report(const uw::task_parameters* task_p, unsigned int k, unsigned int max_k) {
    volatile sig_atomic_t *status = report_status;
    if(status == NULL || task_p->tid >= UWFRAC_MAX_REPORTERS)
        return;

    if(__builtin_expect(status[task_p->tid], false)) {
        sync_printf("tid:%u\tstart:%u\tstop:%u\tk:%u\ttotal:%u\n", task_p->tid, task_p->start, task_p->stop, k, max_k);
        status[task_p->tid] = 0;
    }
}

void uw::register_report_status() {
    // register a signal handler so we can ask the workers for their
    // progress
    report_status = (volatile sig_atomic_t*)calloc(sizeof(sig_atomic_t), UWFRAC_MAX_REPORTERS);
    if(report_status == NULL) {
        fprintf(stderr, "Failed to allocate %zd bytes; [%s]:%d\n",
                sizeof(sig_atomic_t) * UWFRAC_MAX_REPORTERS, __FILE__, __LINE__);
        exit(EXIT_FAILURE);
    }

    previous_handler = signal(SIGUSR1, sig_handler);
    if (previous_handler == SIG_ERR) {
        fprintf(stderr, "Can't catch SIGUSR1\n");
        previous_handler = SIG_DFL;
    }
}

void uw::remove_report_status() {
    if(report_status != NULL) {
        signal(SIGUSR1, previous_handler);
        volatile sig_atomic_t *status = report_status;
        report_status = NULL;
        free((void*)status);
    }
}
