// Copyright Lawrence Livermore National Security, LLC and other ExaCA Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#ifndef THERMALHISTORY_PARSE_HPP
#define THERMALHISTORY_PARSE_HPP

#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

std::string removeWhitespace(std::string line, int pos = -1);
double getInputDouble(std::string val_input, int factor = 0);
void splitString(std::string line, std::vector<std::string> &parsed_line, std::size_t expected_num_values,
                 char separator = ',');
std::vector<std::string> checkForCoordinateHeader(std::string header_line);
bool checkBinaryOutputFormat(std::string filename);
std::string getFileExtension(std::string filename);
std::string getFileStem(std::string filename);
bool parseSnapshotTime(const std::string filename, double &time);
std::string canonicalTimeString(const double time);

// Swaps bits for a variable of type SwapType
template <typename SwapType>
void swapEndian(SwapType &var) {
    // Cast var into a char array (bit values)
    char *var_array = reinterpret_cast<char *>(&var);
    // Size of char array
    int var_size = sizeof(var);
    // Swap the "ith" bit with the bit "i" from the end of the array
    for (long i = 0; i < static_cast<long>(var_size / 2); i++)
        std::swap(var_array[var_size - 1 - i], var_array[i]);
}
// Reads binary data of the type ReadType, optionally swapping the endian format
template <typename ReadType>
ReadType readBinaryData(std::ifstream &instream, bool swap_endian_yn = false) {
    ReadType read_value;
    instream.read(reinterpret_cast<char *>(&read_value), sizeof(ReadType));
    if (swap_endian_yn)
        swapEndian(read_value);
    return read_value;
}

#endif
