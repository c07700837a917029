#ifndef MPLSQ_CONFIG_H
#define MPLSQ_CONFIG_H


#define MPLSQ_ENUMERATIVE 1
#define MPLSQ_SYMBOLIC    2
#define MPLSQ_ENGINE MPLSQ_ENUMERATIVE

// safety cap on hops per simulated packet
#define MPLSQ_DEFAULT_MAX_HOPS 1024

// scenario count above which EnumerationOverflow is raised (policy abort)
#define MPLSQ_DEFAULT_SCENARIO_LIMIT 1000000ULL

#define MPLSQ_DEFAULT_THREADS 1
#define MPLSQ_MAX_THREADS 64

#define MPLSQ_LOG_THRESHOLD 4


#endif
