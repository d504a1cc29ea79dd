// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOrecords.hpp"
#include "CPOtypes.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// grain_record_tests
//---------------------------------------------------------------------------//
void testShardHeader() {
    ShardHeader header("id x  y z", "header.dat");
    EXPECT_EQ(header.numColumns(), 4);
    EXPECT_EQ(header.column("id"), 0);
    EXPECT_EQ(header.column("z"), 3);
    EXPECT_EQ(header.column("olivine_deformation_type"), -1);
    EXPECT_EQ(header.requireColumn("y"), 2);
    EXPECT_THROW(header.requireColumn("full_norm_square"), std::runtime_error);
}

void testReadGrainRecords() {
    std::string contents = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z mineral_1_EA_phi "
                           "mineral_1_EA_theta mineral_1_EA_z\n"
                           "3 10 20 30 40 50 60\n"
                           "7 1 2 3 4 5 6\n"
                           "3 11 21 31 41 51 61\n"
                           "\n";
    std::vector<GrainRecord> grains = readGrainRecords(contents, "grains.dat", 3);
    // Grains of particle 3, in file order
    ASSERT_EQ(grains.size(), 2);
    EXPECT_EQ(grains[0].id, 3);
    EXPECT_TRUE(grains[0].has_mineral[Olivine]);
    EXPECT_TRUE(grains[0].has_mineral[Enstatite]);
    EXPECT_DOUBLE_EQ(grains[0].euler_angles_deg[Olivine][0], 10.0);
    EXPECT_DOUBLE_EQ(grains[0].euler_angles_deg[Olivine][2], 30.0);
    EXPECT_DOUBLE_EQ(grains[0].euler_angles_deg[Enstatite][1], 50.0);
    EXPECT_DOUBLE_EQ(grains[1].euler_angles_deg[Olivine][0], 11.0);
    EXPECT_DOUBLE_EQ(grains[1].euler_angles_deg[Enstatite][2], 61.0);

    // No rows for this particle, and a file with no data at all
    EXPECT_TRUE(readGrainRecords(contents, "grains.dat", 5).empty());
    EXPECT_TRUE(readGrainRecords("", "empty.dat", 3).empty());

    // Only olivine columns present
    std::string olivine_only = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n2 5 6 7\n";
    grains = readGrainRecords(olivine_only, "olivine.dat", 2);
    ASSERT_EQ(grains.size(), 1);
    EXPECT_TRUE(grains[0].has_mineral[Olivine]);
    EXPECT_FALSE(grains[0].has_mineral[Enstatite]);
}

void testMalformedGrainRecords() {
    // Row with a missing field
    std::string short_row = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n1 10 20 30\n1 10 20\n";
    EXPECT_THROW(readGrainRecords(short_row, "short.dat", 1), std::runtime_error);
    // Angle that is not a number, in a row of another particle
    std::string bad_number = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n2 10 abc 30\n1 10 20 30\n";
    EXPECT_THROW(readGrainRecords(bad_number, "bad.dat", 1), std::runtime_error);
    // Mineral with an incomplete set of angle columns
    std::string missing_theta = "id mineral_0_EA_phi mineral_0_EA_z\n1 10 30\n";
    EXPECT_THROW(readGrainRecords(missing_theta, "theta.dat", 1), std::runtime_error);
    // No id column
    std::string missing_id = "mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n10 20 30\n";
    EXPECT_THROW(readGrainRecords(missing_id, "id.dat", 1), std::runtime_error);

    // Ids that are not finite or do not fit in a long integer
    const std::vector<std::string> bad_ids = {"nan", "inf", "1e30", "-9.3e18"};
    for (auto bad_id : bad_ids) {
        std::string bad_id_row = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n" + bad_id + " 1 2 3\n";
        EXPECT_THROW(readGrainRecords(bad_id_row, "bad_id.dat", 5), std::runtime_error);
        EXPECT_THROW(readParticleRecord("id x y\n" + bad_id + " 1 2\n", "bad_id.dat", 5), std::runtime_error);
    }
    // Integral values in floating point notation are accepted
    std::vector<GrainRecord> float_id_grains =
        readGrainRecords("id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n5.0 1 2 3\n", "float_id.dat", 5);
    EXPECT_EQ(float_id_grains.size(), 1);
    EXPECT_THROW(readGrainRecords("id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z\n5.5 1 2 3\n", "half_id.dat",
                                  5),
                 std::runtime_error);

    // The error names the file and the row
    try {
        readGrainRecords(short_row, "short.dat", 1);
        FAIL() << "Expected a malformed row error";
    }
    catch (const std::runtime_error &err) {
        std::string message = err.what();
        EXPECT_NE(message.find("short.dat"), std::string::npos);
        EXPECT_NE(message.find("Row 2"), std::string::npos);
    }
}

//---------------------------------------------------------------------------//
// particle_record_tests
//---------------------------------------------------------------------------//
std::string particleHeader() {
    std::string header = "id x y z olivine_deformation_type full_norm_square";
    for (int n = 0; n < num_symmetry_classes; n++) {
        for (int comp = 1; comp <= 3; comp++)
            header += " " + symmetryClassColumnPrefix(n) + "_norm_square_p" + std::to_string(comp);
    }
    header += " isotropic_norm_square";
    return header;
}

void testReadParticleRecord() {
    // Values of p1..p3 for each class: (n + 1), (n + 1) / 2, (n + 1) / 4
    std::string row_values = "";
    for (int n = 0; n < num_symmetry_classes; n++)
        row_values += " " + std::to_string(n + 1) + " " + std::to_string((n + 1) / 2.0) + " " +
                      std::to_string((n + 1) / 4.0);
    std::string contents = particleHeader() + "\n" + "4 1.5 2.5 3.5 2 30" + row_values + " 15\n" +
                           "9 0 0 0 0 30" + row_values + " 15\n" + "4 5.5 6.5 7.5 1 60" + row_values + " 45\n";

    // Last matching row wins
    ParticleRecord particle = readParticleRecord(contents, "particles.dat", 4);
    EXPECT_EQ(particle.id, 4);
    EXPECT_DOUBLE_EQ(particle.x, 5.5);
    EXPECT_DOUBLE_EQ(particle.y, 6.5);
    EXPECT_TRUE(particle.has_z);
    EXPECT_DOUBLE_EQ(particle.z, 7.5);
    EXPECT_TRUE(particle.has_deformation_type);
    EXPECT_DOUBLE_EQ(particle.olivine_deformation_type, 1.0);
    EXPECT_TRUE(particle.hasElasticity());
    EXPECT_DOUBLE_EQ(particle.full_norm_square, 60.0);
    EXPECT_DOUBLE_EQ(particle.norm_square[Orthorhombic][0], 3.0);
    EXPECT_DOUBLE_EQ(particle.norm_square[Hexagonal][2], 1.25);
    EXPECT_DOUBLE_EQ(particle.isotropic_norm_square, 45.0);

    // Absent particle gives the default record
    ParticleRecord default_particle = readParticleRecord(contents, "particles.dat", 100);
    EXPECT_EQ(default_particle.id, 0);
    EXPECT_DOUBLE_EQ(default_particle.x, 0.0);
    EXPECT_TRUE(default_particle.has_z);
    EXPECT_DOUBLE_EQ(default_particle.z, 0.0);
    EXPECT_FALSE(default_particle.has_deformation_type);
    EXPECT_FALSE(default_particle.hasElasticity());

    // 2D output without optional columns
    ParticleRecord particle_2d = readParticleRecord("id x y\n8 1 2\n", "particles_2d.dat", 8);
    EXPECT_EQ(particle_2d.id, 8);
    EXPECT_FALSE(particle_2d.has_z);
    EXPECT_FALSE(particle_2d.has_full_norm_square);
    EXPECT_FALSE(particle_2d.hasElasticity());

    // Required columns and field counts
    EXPECT_THROW(readParticleRecord("id y\n8 2\n", "no_x.dat", 8), std::runtime_error);
    EXPECT_THROW(readParticleRecord("id x y\n8 1\n", "short.dat", 8), std::runtime_error);
    EXPECT_THROW(readParticleRecord("id x y\n8 1 two\n", "bad.dat", 8), std::runtime_error);
}

//---------------------------------------------------------------------------//
// anisotropy_tests
//---------------------------------------------------------------------------//
void testElasticAnisotropy() {
    ParticleRecord particle;
    particle.id = 1;
    particle.has_full_norm_square = true;
    particle.full_norm_square = 100.0;
    particle.has_isotropic_norm_square = true;
    particle.isotropic_norm_square = 80.0;
    // p1 values sum to 20
    double p1[num_symmetry_classes] = {1.0, 2.0, 3.0, 4.0, 10.0};
    for (int n = 0; n < num_symmetry_classes; n++) {
        particle.has_norm_square[n] = true;
        particle.norm_square[n][0] = p1[n];
        particle.norm_square[n][1] = 0.5 * p1[n];
        particle.norm_square[n][2] = 0.0;
    }
    ElasticAnisotropy anisotropy(particle);
    EXPECT_DOUBLE_EQ(anisotropy.total_anisotropy, 20.0);
    EXPECT_DOUBLE_EQ(anisotropy.anisotropic_percent, 20.0);
    EXPECT_DOUBLE_EQ(anisotropy.percent_of_full[Hexagonal][0], 10.0);
    EXPECT_DOUBLE_EQ(anisotropy.percent_of_full[Orthorhombic][1], 1.5);
    EXPECT_DOUBLE_EQ(anisotropy.percent_of_anisotropic[Hexagonal][0], 50.0);
    EXPECT_DOUBLE_EQ(anisotropy.percent_of_anisotropic[Triclinic][1], 2.5);
    EXPECT_DOUBLE_EQ(anisotropy.percent_of_anisotropic[Tetragonal][2], 0.0);

    // Any missing value means the summary cannot be made
    particle.has_norm_square[Monoclinic] = false;
    EXPECT_THROW(ElasticAnisotropy incomplete(particle), std::runtime_error);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, grain_records) {
    testShardHeader();
    testReadGrainRecords();
    testMalformedGrainRecords();
}
TEST(TEST_CATEGORY, particle_records) {
    testReadParticleRecord();
    testElasticAnisotropy();
}
} // end namespace Test
