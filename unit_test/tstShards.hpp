// Copyright Lawrence Livermore National Security, LLC and other CPOAnalyzer Project Developers.
// See the top-level LICENSE file for details.
//
// SPDX-License-Identifier: MIT

#include "CPOshards.hpp"

#include <gtest/gtest.h>

#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Test {
//---------------------------------------------------------------------------//
// Helpers: shard files of one experiment directory
//---------------------------------------------------------------------------//
const std::string grain_columns = "id mineral_0_EA_phi mineral_0_EA_theta mineral_0_EA_z";

void writeShard(const std::string filename, const std::string contents, const bool compressed) {
    std::ofstream shard_file(filename, std::ios::binary);
    if (compressed) {
        uLongf compressed_size = compressBound(contents.size());
        std::vector<char> compressed_data(compressed_size);
        int ret = compress(reinterpret_cast<Bytef *>(compressed_data.data()), &compressed_size,
                           reinterpret_cast<const Bytef *>(contents.data()), contents.size());
        if (ret != Z_OK)
            throw std::runtime_error("Error: zlib compression failed in test");
        shard_file.write(compressed_data.data(), compressed_size);
    }
    else
        shard_file << contents;
    shard_file.close();
}

// Timestep 3: an empty shard, a shard without particle 5, the shard holding particle 5, and a malformed shard that
// must never be read. Timestep 4: two shards without particle 5
void writeShardFiles(const std::string directory, const bool compressed) {
    std::filesystem::create_directories(directory + "CPO");
    writeShard(getShardFilename(directory, "CPO/grains", 3, 0), "", false);
    writeShard(getShardFilename(directory, "CPO/grains", 3, 1), grain_columns + "\n8 1 2 3\n8 4 5 6\n", compressed);
    writeShard(getShardFilename(directory, "CPO/grains", 3, 2),
               grain_columns + "\n4 1 1 1\n5 10 20 30\n5 40 50 60\n5 70 80 90\n", compressed);
    writeShard(getShardFilename(directory, "CPO/grains", 3, 3), grain_columns + "\n9 a b\n", false);
    // Particle metadata is never compressed
    writeShard(getShardFilename(directory, "CPO/particles", 3, 0), "", false);
    writeShard(getShardFilename(directory, "CPO/particles", 3, 2), "id x y z\n4 0 0 0\n5 1.5 2.5 3.5\n", false);

    writeShard(getShardFilename(directory, "CPO/grains", 4, 0), grain_columns + "\n1 1 2 3\n", compressed);
    writeShard(getShardFilename(directory, "CPO/grains", 4, 1), grain_columns + "\n2 1 2 3\n", compressed);
}

//---------------------------------------------------------------------------//
// shard_tests
//---------------------------------------------------------------------------//
void testShardFilename() {
    EXPECT_EQ(getShardFilename("/data/exp_1/", "particle_CPO/weighted_CPO", 12, 3),
              "/data/exp_1/particle_CPO/weighted_CPO-00012.0003.dat");
    EXPECT_EQ(getShardFilename("", "particles", 0, 125), "particles-00000.0125.dat");
}

void testLocateParticle(const bool compressed) {
    std::string directory = (compressed) ? "TestShardsCompressed/" : "TestShards/";
    writeShardFiles(directory, compressed);
    ShardLocator locator(directory, "CPO/grains", "CPO/particles", compressed);

    // Skips the empty shard and the shard without the particle, stops before the malformed shard
    ParticleLookup lookup = locator.locateParticle(3, 5);
    EXPECT_TRUE(lookup.found);
    EXPECT_EQ(lookup.shard_index, 2);
    EXPECT_EQ(lookup.grain_file, directory + "CPO/grains-00003.0002.dat");
    ASSERT_EQ(lookup.grains.size(), 3);
    EXPECT_DOUBLE_EQ(lookup.grains[0].euler_angles_deg[Olivine][0], 10.0);
    EXPECT_DOUBLE_EQ(lookup.grains[2].euler_angles_deg[Olivine][2], 90.0);
    EXPECT_EQ(lookup.particle.id, 5);
    EXPECT_DOUBLE_EQ(lookup.particle.x, 1.5);
    EXPECT_DOUBLE_EQ(lookup.particle.z, 3.5);

    // Particle not present in any shard: the scan stops at the first missing shard
    ParticleLookup missing = locator.locateParticle(4, 5);
    EXPECT_FALSE(missing.found);
    EXPECT_EQ(missing.shard_index, 2);
    EXPECT_TRUE(missing.grains.empty());

    // Timestep without any shard
    ParticleLookup no_shards = locator.locateParticle(7, 5);
    EXPECT_FALSE(no_shards.found);
    EXPECT_EQ(no_shards.shard_index, 0);

    // Grain data found but the matching particle file does not exist
    EXPECT_THROW(locator.locateParticle(3, 8), std::runtime_error);
    // Particle absent from the first shards reaches the malformed shard
    EXPECT_THROW(locator.locateParticle(3, 9), std::runtime_error);
}

// Grain data for a particle found in the shard, with no row in the matching particle file
void testParticleWithoutMetadata() {
    std::string directory = "TestShardsMetadata/";
    std::filesystem::create_directories(directory);
    writeShard(getShardFilename(directory, "grains", 0, 0), grain_columns + "\n6 1 2 3\n", false);
    writeShard(getShardFilename(directory, "particles", 0, 0), "id x y\n7 1 2\n", false);
    ShardLocator locator(directory, "grains", "particles", false);
    ParticleLookup lookup = locator.locateParticle(0, 6);
    EXPECT_TRUE(lookup.found);
    EXPECT_EQ(lookup.grains.size(), 1);
    EXPECT_EQ(lookup.particle.id, 0);
    EXPECT_DOUBLE_EQ(lookup.particle.x, 0.0);
}

// Grains of one particle written to two shards: only those of the first shard holding the particle are returned
void testSplitParticle() {
    std::string directory = "TestShardsSplit/";
    std::filesystem::create_directories(directory);
    writeShard(getShardFilename(directory, "grains", 2, 0), grain_columns + "\n11 1 2 3\n", false);
    writeShard(getShardFilename(directory, "grains", 2, 1), grain_columns + "\n11 4 5 6\n11 7 8 9\n", false);
    writeShard(getShardFilename(directory, "particles", 2, 0), "id x y\n11 1 2\n", false);
    ShardLocator locator(directory, "grains", "particles", false);
    ParticleLookup lookup = locator.locateParticle(2, 11);
    EXPECT_TRUE(lookup.found);
    EXPECT_EQ(lookup.shard_index, 0);
    ASSERT_EQ(lookup.grains.size(), 1);
    EXPECT_DOUBLE_EQ(lookup.grains[0].euler_angles_deg[Olivine][0], 1.0);
}

// Compressed grain shards read without inflating are not valid text data
void testCompressionMismatch() {
    std::string directory = "TestShardsMismatch/";
    std::filesystem::create_directories(directory);
    writeShard(getShardFilename(directory, "grains", 0, 0), grain_columns + "\n6 1 2 3\n", false);
    ShardLocator locator(directory, "grains", "particles", true);
    EXPECT_THROW(locator.locateParticle(0, 6), std::runtime_error);
}
//---------------------------------------------------------------------------//
// RUN TESTS
//---------------------------------------------------------------------------//
TEST(TEST_CATEGORY, shards) {
    testShardFilename();
    testLocateParticle(false);
    testLocateParticle(true);
    testParticleWithoutMetadata();
    testSplitParticle();
    testCompressionMismatch();
}
} // end namespace Test
