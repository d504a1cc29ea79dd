// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOtimeresolver.hpp"

#include <gtest/gtest.h>

#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// time_data_tests
//---------------------------------------------------------------------------//
void writeStatisticsFile(std::string filename) {
    std::ofstream statistics(filename);
    statistics << "# 1: Time step number" << std::endl;
    statistics << "# 2: Time (years)" << std::endl;
    statistics << "# 3: Particle LPO file name (particle_LPO)" << std::endl;
    statistics << "0   0.0000e+00 particle_LPO/particles-00000" << std::endl;
    statistics << "   1 1.0000e+00   -" << std::endl;
    statistics << "2 \t 1.0000e+00  particle_LPO/particles-00001" << std::endl;
    statistics << std::endl;
    statistics << "3 2.0000e+00 particle_LPO/particles-00002  " << std::endl;
    statistics << "4 5.0000e+00 particle_LPO/particles-00003" << std::endl;
    statistics.close();
}

void testReadTimestepTimes() {
    writeStatisticsFile("TestStatistics");
    std::vector<double> times = readTimestepTimes("TestStatistics");
    // Only lines naming a particle output file are kept, comment lines are skipped
    ASSERT_EQ(times.size(), 4);
    EXPECT_DOUBLE_EQ(times[0], 0.0);
    EXPECT_DOUBLE_EQ(times[1], 1.0);
    EXPECT_DOUBLE_EQ(times[2], 2.0);
    EXPECT_DOUBLE_EQ(times[3], 5.0);

    // Other marker
    std::vector<double> no_times = readTimestepTimes("TestStatistics", "velocity_output");
    EXPECT_TRUE(no_times.empty());

    // Missing file and unparsable time
    EXPECT_THROW(readTimestepTimes("TestMissingStatistics"), std::runtime_error);
    std::ofstream bad_statistics("TestBadStatistics");
    bad_statistics << "0 zero particle_LPO/particles-00000" << std::endl;
    bad_statistics.close();
    EXPECT_THROW(readTimestepTimes("TestBadStatistics"), std::runtime_error);
    std::ofstream short_statistics("TestShortStatistics");
    short_statistics << "particle_LPO" << std::endl;
    short_statistics.close();
    EXPECT_THROW(readTimestepTimes("TestShortStatistics"), std::runtime_error);
}

//---------------------------------------------------------------------------//
// resolve_tests
//---------------------------------------------------------------------------//
void testResolveTimestep() {
    std::vector<double> times = {0.0, 1.0, 2.0, 5.0};
    EXPECT_EQ(resolveTimestep(times, 1.6), 2);
    EXPECT_EQ(resolveTimestep(times, 1.4), 1);
    // Exact matches and times outside of the recorded range
    EXPECT_EQ(resolveTimestep(times, 0.0), 0);
    EXPECT_EQ(resolveTimestep(times, 5.0), 3);
    EXPECT_EQ(resolveTimestep(times, -3.0), 0);
    EXPECT_EQ(resolveTimestep(times, 100.0), 3);
    // Equal distance resolves to the earlier timestep
    EXPECT_EQ(resolveTimestep(times, 0.5), 0);
    EXPECT_EQ(resolveTimestep(times, 3.5), 2);

    std::vector<double> single_time = {2.0};
    EXPECT_EQ(resolveTimestep(single_time, 0.0), 0);
    EXPECT_EQ(resolveTimestep(single_time, 10.0), 0);

    std::vector<double> no_times;
    EXPECT_THROW(resolveTimestep(no_times, 1.0), std::runtime_error);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, time_resolver) {
    testReadTimestepTimes();
    testResolveTimestep();
}
} // end namespace Test
