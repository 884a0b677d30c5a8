#ifndef THERMALHISTORY_TEST_HIP_CATEGORY_HPP
#define THERMALHISTORY_TEST_HIP_CATEGORY_HPP

#define TEST_CATEGORY hip
#define TEST_EXECSPACE Kokkos::HIP
#define TEST_MEMSPACE Kokkos::HIPSpace
#define TEST_DEVICE Kokkos::Device<Kokkos::HIP, Kokkos::HIPSpace>

#endif
