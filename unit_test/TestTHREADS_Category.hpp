#ifndef THERMALHISTORY_TEST_THREADS_CATEGORY_HPP
#define THERMALHISTORY_TEST_THREADS_CATEGORY_HPP

#define TEST_CATEGORY threads
#define TEST_EXECSPACE Kokkos::Threads
#define TEST_MEMSPACE Kokkos::HostSpace
#define TEST_DEVICE Kokkos::Device<Kokkos::Threads, Kokkos::HostSpace>

#endif
