// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOparsefiles.hpp"

#include <gtest/gtest.h>

#include <zlib.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Helper: compress a string with zlib, as done by the simulation code for compressed particle output
//---------------------------------------------------------------------------//
std::string compressString(const std::string &data) {
    uLongf compressed_size = compressBound(data.size());
    std::vector<char> compressed(compressed_size);
    int ret = compress(reinterpret_cast<Bytef *>(compressed.data()), &compressed_size,
                       reinterpret_cast<const Bytef *>(data.data()), data.size());
    if (ret != Z_OK)
        throw std::runtime_error("Error: zlib compression failed in test");
    return std::string(compressed.data(), compressed_size);
}

//---------------------------------------------------------------------------//
// string_tests
//---------------------------------------------------------------------------//
void testStringHelpers() {
    EXPECT_EQ(trimWhitespace("  1 2.5  statistics \r\n"), "1 2.5  statistics");
    EXPECT_EQ(trimWhitespace(" \t \r"), "");
    EXPECT_EQ(collapseSpaces("5   1.25e+05 \t particle_LPO/particles-00005"), "5 1.25e+05 particle_LPO/particles-00005");

    std::vector<std::string> parsed_line = splitWhitespace("  id   mineral_0_EA_phi\tmineral_0_EA_theta ");
    ASSERT_EQ(parsed_line.size(), 3);
    EXPECT_EQ(parsed_line[0], "id");
    EXPECT_EQ(parsed_line[1], "mineral_0_EA_phi");
    EXPECT_EQ(parsed_line[2], "mineral_0_EA_theta");
    EXPECT_TRUE(splitWhitespace("   ").empty());
}

void testNumberParsing() {
    EXPECT_DOUBLE_EQ(getInputDouble("1.5", "test"), 1.5);
    EXPECT_DOUBLE_EQ(getInputDouble(" -2.5e-3 ", "test"), -2.5e-3);
    EXPECT_DOUBLE_EQ(getInputDouble("90", "test"), 90.0);
    EXPECT_EQ(getInputLong("42", "test"), 42);
    EXPECT_EQ(getInputLong(" -7", "test"), -7);

    // Partial numbers and words are errors
    EXPECT_THROW(getInputDouble("1.5abc", "test"), std::runtime_error);
    EXPECT_THROW(getInputDouble("abc", "test"), std::runtime_error);
    EXPECT_THROW(getInputDouble("", "test"), std::runtime_error);
    EXPECT_THROW(getInputLong("4.5", "test"), std::runtime_error);
    EXPECT_THROW(getInputLong("x", "test"), std::runtime_error);

    // The error message carries the context given
    try {
        getInputDouble("bad", "file \"a.dat\", row 3, column x");
        FAIL() << "Expected a parse error";
    }
    catch (const std::runtime_error &err) {
        std::string message = err.what();
        EXPECT_NE(message.find("row 3"), std::string::npos);
        EXPECT_NE(message.find("bad"), std::string::npos);
    }
}

//---------------------------------------------------------------------------//
// file_read_tests
//---------------------------------------------------------------------------//
void testFileChecks() {
    std::ofstream empty_file("TestEmptyShard.dat");
    empty_file.close();
    std::ofstream data_file("TestDataShard.dat");
    data_file << "id x y" << std::endl;
    data_file.close();

    EXPECT_TRUE(checkFileExists("TestEmptyShard.dat", 1, false));
    EXPECT_FALSE(checkFileExists("TestMissingShard.dat", 1, false));
    EXPECT_THROW(checkFileExists("TestMissingShard.dat", 1), std::runtime_error);
    EXPECT_TRUE(checkFileEmpty("TestEmptyShard.dat"));
    EXPECT_FALSE(checkFileEmpty("TestDataShard.dat"));
    EXPECT_THROW(checkFileEmpty("TestMissingShard.dat"), std::runtime_error);
}

void testCompressedRead() {
    std::string contents = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n1 10 20 30\n1 40 50 60\n";
    std::string compressed = compressString(contents);
    EXPECT_EQ(inflateData(compressed, "in memory"), contents);

    std::ofstream compressed_file("TestCompressedShard.dat", std::ios::binary);
    compressed_file << compressed;
    compressed_file.close();
    EXPECT_EQ(readFileContents("TestCompressedShard.dat", true), contents);
    // Read without inflating, the raw bytes are returned
    EXPECT_EQ(readFileContents("TestCompressedShard.dat", false), compressed);

    // Undecodable and truncated streams are errors
    EXPECT_THROW(inflateData(contents, "plain text"), std::runtime_error);
    EXPECT_THROW(inflateData(compressed.substr(0, compressed.size() / 2), "truncated"), std::runtime_error);
    EXPECT_THROW(readFileContents("TestMissingShard.dat", false), std::runtime_error);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, parse_strings) {
    testStringHelpers();
    testNumberParsing();
}
TEST(TEST_CATEGORY, parse_files) {
    testFileChecks();
    testCompressedRead();
}
} // end namespace Test
