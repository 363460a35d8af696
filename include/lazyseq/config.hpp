#pragma once

#define LAZYSEQ_VERSION_MAJOR 0
#define LAZYSEQ_VERSION_MINOR 5
#define LAZYSEQ_VERSION_PATCH 2

#define LAZYSEQ_VERSION \
    (LAZYSEQ_VERSION_MAJOR * 10000 + LAZYSEQ_VERSION_MINOR * 100 + LAZYSEQ_VERSION_PATCH)

#if !defined(__cpp_impl_coroutine) || !defined(__cpp_concepts)
#error "lazyseq requires C++20 coroutines and concepts"
#endif
